#include "app/command_line.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <exception>
#include <sstream>

#include <boost/program_options.hpp>

#include "core/logging.hpp"
#include "services/mesh/object_isolator.hpp"
#include "services/pipeline/study_pipeline.hpp"
#include "services/pipeline/two_stage_driver.hpp"

#ifndef DICOM_MESHER_VERSION
#define DICOM_MESHER_VERSION "unknown"
#endif

namespace dicom_mesher::app {

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

auto& getLogger()
{
    static auto logger = logging::LoggerFactory::create("dicom_mesher");
    return logger;
}

std::unexpected<CommandLineError> usageError(std::string message)
{
    return std::unexpected(CommandLineError{std::move(message)});
}

std::optional<Command> parseCommand(const std::string& name)
{
    if (name == "convert") return Command::Convert;
    if (name == "batch") return Command::Batch;
    if (name == "isolate") return Command::Isolate;
    if (name == "pipeline") return Command::Pipeline;
    if (name == "organize") return Command::Organize;
    if (name == "help") return Command::Help;
    if (name == "version") return Command::Version;
    return std::nullopt;
}

/// Count and strip -v, -vv, --verbose
std::vector<std::string> takeVerbosity(int argc, const char* const argv[], int& verbosity)
{
    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose") {
            ++verbosity;
            continue;
        }
        if (arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v' &&
            std::all_of(arg.begin() + 1, arg.end(), [](char c) { return c == 'v'; })) {
            verbosity += static_cast<int>(arg.size() - 1);
            continue;
        }
        rest.push_back(arg);
    }
    return rest;
}

std::expected<void, CommandLineError>
applySwitches(const std::vector<std::string>& names, bool enabled, services::ConfigOverrides& o)
{
    for (const auto& name : names) {
        if (name == "shrink") o.shrink = enabled;
        else if (name == "anisotropic") o.anisotropic = enabled;
        else if (name == "median") o.median = enabled;
        else if (name == "largest") o.largestRegion = enabled;
        else if (name == "rotation") o.rotation = enabled;
        else return usageError("Unknown switch '" + name +
                               "' (expected shrink, anisotropic, median, largest or rotation)");
    }
    return {};
}

std::shared_ptr<const services::IComponentSelector> makeSelector(const CommandLineOptions& options)
{
    if (options.selector == SelectorKind::ExtentRange) {
        return std::make_shared<services::ExtentRangeSelector>(options.minExtent, options.maxExtent);
    }
    return std::make_shared<services::LargestComponentSelector>();
}

int writeReport(const services::RunReport& report, const CommandLineOptions& options)
{
    if (!options.reportPath) {
        return exit_code::Success;
    }
    auto written = report.writeJson(*options.reportPath);
    if (!written) {
        getLogger()->error("{}", written.error().toString());
        return exit_code::SomeFailed;
    }
    getLogger()->info("Run report written to {}", options.reportPath->string());
    return exit_code::Success;
}

int finishRun(const std::expected<services::RunReport, services::PipelineError>& report,
              const CommandLineOptions& options)
{
    if (!report) {
        getLogger()->critical("Run aborted: {}", report.error().toString());
        return exit_code::AllFailed;
    }
    const int reportStatus = writeReport(*report, options);
    return std::max(report->exitCode(), reportStatus);
}

int runConvert(const CommandLineOptions& options, const services::PipelineConfig& config)
{
    services::StudyPipeline pipeline;
    auto result = pipeline.run(options.input, options.output, config);
    if (!result) {
        getLogger()->error("Conversion failed: {}", result.error().toString());
        return exit_code::AllFailed;
    }
    return exit_code::Success;
}

int runIsolate(const CommandLineOptions& options)
{
    std::error_code ec;
    if (fs::is_directory(options.input, ec)) {
        services::TwoStageDriver driver(
            services::BatchController(options.batch, nullptr),
            std::make_shared<services::ObjectIsolator>(makeSelector(options)));
        return finishRun(driver.isolateDirectory(options.input, options.output), options);
    }

    services::ObjectIsolator isolator(makeSelector(options));
    auto result = isolator.isolate(options.input, options.output);
    if (!result) {
        getLogger()->error("Isolation failed: {}", result.error().toString());
        return exit_code::AllFailed;
    }
    return exit_code::Success;
}

int runOrganize(const CommandLineOptions& options)
{
    services::StudyOrganizer organizer(options.organize);
    auto summary = organizer.organize(options.input, options.output);
    if (!summary) {
        getLogger()->critical("Organize aborted: {}", summary.error().toString());
        return exit_code::AllFailed;
    }
    if (summary->errors == 0) {
        return exit_code::Success;
    }
    return summary->moved == 0 ? exit_code::AllFailed : exit_code::SomeFailed;
}

}  // namespace

std::expected<std::vector<double>, CommandLineError>
parseThresholdList(const std::string& text)
{
    std::vector<double> values;
    std::string token;
    std::stringstream stream(text);
    while (std::getline(stream, token, text.find(';') != std::string::npos ? ';' : ',')) {
        const auto first = token.find_first_not_of(" \t");
        const auto last = token.find_last_not_of(" \t");
        if (first == std::string::npos) {
            return usageError("Empty value in threshold list '" + text + "'");
        }
        token = token.substr(first, last - first + 1);

        double value = 0.0;
        const auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || end != token.data() + token.size()) {
            return usageError("Not a number in threshold list: '" + token + "'");
        }
        values.push_back(value);
    }
    if (values.size() != 4) {
        return usageError("Double threshold needs 4 values, got " + std::to_string(values.size()));
    }
    return values;
}

std::expected<CommandLineOptions, CommandLineError>
parseCommandLine(int argc, const char* const argv[])
{
    CommandLineOptions options;
    const auto args = takeVerbosity(argc, argv, options.verbosity);

    po::options_description general("General options");
    general.add_options()
        ("help,h", "Show this help")
        ("output,o", po::value<std::string>(), "Output mesh file or directory")
        ("config", po::value<std::string>(), "JSON configuration overrides file")
        ("log-dir", po::value<std::string>(), "Write a run log file into this directory")
        ("report", po::value<std::string>(), "Write the JSON run report to this file")
        ("verbose,v", "Increase console verbosity (repeatable: -vv)");

    po::options_description conversion("Conversion options");
    conversion.add_options()
        ("preset", po::value<std::string>(), "Named preset: default, skullnet")
        ("type,t", po::value<std::string>(), "Tissue type: bone, skin, muscle, soft, fat")
        ("isovalue,i", po::value<double>(), "Iso-surface value")
        ("double,d", po::value<std::string>(), "Explicit double thresholds \"a;b;c;d\"")
        ("anisotropic,a", po::bool_switch(), "Anisotropic smoothing of the volume")
        ("enable", po::value<std::vector<std::string>>()->composing(),
            "Enable shrink, anisotropic, median, largest or rotation")
        ("disable", po::value<std::vector<std::string>>()->composing(),
            "Disable shrink, anisotropic, median, largest or rotation")
        ("shrink-max", po::value<int>(), "Largest volume dimension after shrinking")
        ("smooth", po::value<int>(), "Mesh smoothing iterations")
        ("reduce", po::value<double>(), "Fraction of triangles removed by decimation")
        ("rotaxis", po::value<int>(), "Mesh rotation axis (0, 1, 2); needs --enable rotation")
        ("rotangle", po::value<double>(), "Mesh rotation angle in degrees; needs --enable rotation")
        ("pad", po::value<int>(), "Voxels of padding on every side")
        ("ct", po::bool_switch(), "Only accept CT studies")
        ("metadata,m", po::bool_switch(), "Write <stem>.volume.txt next to each mesh");

    po::options_description batch("Batch options");
    batch.add_options()
        ("low-quality-threshold", po::value<int>(), "Skip studies with fewer slices (default 160)")
        ("dedup", po::bool_switch(), "Convert only the first study of each patient")
        ("prefix", po::value<std::string>(), "Output file name prefix")
        ("extension", po::value<std::string>(), "Output mesh extension (default .stl)")
        ("keep-intermediate", po::bool_switch(), "pipeline: keep the unisolated meshes");

    po::options_description isolation("Isolation options");
    isolation.add_options()
        ("selector", po::value<std::string>(), "Component selector: largest, extent")
        ("min-extent", po::value<double>(), "extent selector: smallest object size in mm")
        ("max-extent", po::value<double>(), "extent selector: largest object size in mm");

    po::options_description organize("Organize options");
    organize.add_options()
        ("modality", po::value<std::string>(), "Modality to keep (default CT)")
        ("body-part", po::value<std::string>(), "Body part examined to keep (default HEAD)")
        ("ledger", po::value<std::string>(), "Processed-files ledger (JSON)")
        ("subdirs", po::bool_switch(), "Files are in subdirectories of the input");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("input", po::value<std::string>());

    po::positional_options_description positional;
    positional.add("command", 1).add("input", 1);

    po::options_description visible(
        "Usage: dicom_mesher <convert|batch|isolate|pipeline|organize> [options] <input>");
    visible.add(general).add(conversion).add(batch).add(isolation).add(organize);

    po::options_description all;
    all.add(visible).add(hidden);

    std::ostringstream help;
    help << visible;
    options.helpText = help.str();

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(args).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        return usageError(e.what());
    }

    if (vm.count("help") || !vm.count("command")) {
        options.command = Command::Help;
        return options;
    }

    const auto command = parseCommand(vm["command"].as<std::string>());
    if (!command) {
        return usageError("Unknown command '" + vm["command"].as<std::string>() + "'");
    }
    options.command = *command;
    if (options.command == Command::Help || options.command == Command::Version) {
        return options;
    }

    if (!vm.count("input")) {
        return usageError("Missing input");
    }
    if (!vm.count("output")) {
        return usageError("Missing --output");
    }
    options.input = vm["input"].as<std::string>();
    options.output = vm["output"].as<std::string>();

    if (vm.count("config")) options.configFile = fs::path(vm["config"].as<std::string>());
    if (vm.count("log-dir")) options.logDirectory = fs::path(vm["log-dir"].as<std::string>());
    if (vm.count("report")) options.reportPath = fs::path(vm["report"].as<std::string>());

    // Conversion layer
    auto& o = options.overrides;
    if (vm.count("preset")) o.preset = vm["preset"].as<std::string>();
    if (vm.count("type")) o.tissue = vm["type"].as<std::string>();
    if (vm.count("isovalue")) o.isoValue = vm["isovalue"].as<double>();
    if (vm.count("double")) {
        auto thresholds = parseThresholdList(vm["double"].as<std::string>());
        if (!thresholds) {
            return std::unexpected(thresholds.error());
        }
        o.thresholds = *thresholds;
    }
    if (vm["anisotropic"].as<bool>()) o.anisotropic = true;
    if (vm.count("rotaxis")) o.rotationAxis = vm["rotaxis"].as<int>();
    if (vm.count("rotangle")) o.rotationAngle = vm["rotangle"].as<double>();
    if (vm.count("enable")) {
        auto applied = applySwitches(vm["enable"].as<std::vector<std::string>>(), true, o);
        if (!applied) return std::unexpected(applied.error());
    }
    if (vm.count("disable")) {
        auto applied = applySwitches(vm["disable"].as<std::vector<std::string>>(), false, o);
        if (!applied) return std::unexpected(applied.error());
    }
    if (vm.count("shrink-max")) {
        const int value = vm["shrink-max"].as<int>();
        if (value < 1) return usageError("--shrink-max must be at least 1");
        o.shrinkMaxDimension = static_cast<unsigned int>(value);
    }
    if (vm.count("smooth")) o.smoothingIterations = vm["smooth"].as<int>();
    if (vm.count("reduce")) o.reduction = vm["reduce"].as<double>();
    if (vm.count("pad")) {
        const int value = vm["pad"].as<int>();
        if (value < 0) return usageError("--pad must not be negative");
        o.padVoxels = static_cast<unsigned int>(value);
    }
    if (vm["ct"].as<bool>()) o.requireCT = true;
    if (vm["metadata"].as<bool>()) o.writeVolumeInfo = true;

    // Batch
    if (vm.count("low-quality-threshold")) {
        const int value = vm["low-quality-threshold"].as<int>();
        if (value < 0) return usageError("--low-quality-threshold must not be negative");
        options.batch.lowQualityThreshold = static_cast<size_t>(value);
    }
    options.batch.deduplicatePatients = vm["dedup"].as<bool>();
    if (vm.count("prefix")) options.batch.prefix = vm["prefix"].as<std::string>();
    if (vm.count("extension")) {
        auto extension = vm["extension"].as<std::string>();
        if (!extension.empty() && extension.front() != '.') {
            extension.insert(extension.begin(), '.');
        }
        options.batch.extension = extension;
    }
    options.keepIntermediate = vm["keep-intermediate"].as<bool>();

    // Isolation
    if (vm.count("selector")) {
        const auto name = vm["selector"].as<std::string>();
        if (name == "largest") options.selector = SelectorKind::Largest;
        else if (name == "extent") options.selector = SelectorKind::ExtentRange;
        else return usageError("Unknown selector '" + name + "' (expected largest or extent)");
    }
    if (vm.count("min-extent")) options.minExtent = vm["min-extent"].as<double>();
    if (vm.count("max-extent")) options.maxExtent = vm["max-extent"].as<double>();
    if (options.minExtent < 0.0 || options.minExtent > options.maxExtent) {
        return usageError("--min-extent must lie between 0 and --max-extent");
    }

    // Organize
    if (vm.count("modality")) options.organize.modality = vm["modality"].as<std::string>();
    if (vm.count("body-part")) options.organize.bodyPart = vm["body-part"].as<std::string>();
    if (vm.count("ledger")) options.organize.ledgerPath = vm["ledger"].as<std::string>();
    options.organize.recurseSubdirectories = vm["subdirs"].as<bool>();

    return options;
}

std::expected<services::PipelineConfig, services::PipelineError>
resolveConfig(const CommandLineOptions& options)
{
    services::ConfigOverrides layered;
    if (options.configFile) {
        auto fromFile = services::loadOverridesFile(*options.configFile);
        if (!fromFile) {
            return std::unexpected(fromFile.error());
        }
        layered = *fromFile;
    }
    layered.merge(options.overrides);
    return services::resolvePipelineConfig(layered);
}

int runCommand(const CommandLineOptions& options)
{
    switch (options.command) {
        case Command::Help:
            std::fputs(options.helpText.c_str(), stdout);
            return exit_code::Success;
        case Command::Version:
            std::printf("dicom_mesher %s\n", DICOM_MESHER_VERSION);
            return exit_code::Success;
        case Command::Isolate:
            return runIsolate(options);
        case Command::Organize:
            return runOrganize(options);
        default:
            break;
    }

    auto config = resolveConfig(options);
    if (!config) {
        getLogger()->error("{}", config.error().toString());
        return exit_code::UsageError;
    }
    getLogger()->info("Configuration: {}", services::describe(*config));

    auto pipeline = std::make_shared<const services::StudyPipeline>();
    switch (options.command) {
        case Command::Convert:
            return runConvert(options, *config);
        case Command::Batch: {
            services::BatchController controller(
                options.batch, services::BatchController::pipelineRunner(pipeline, *config));
            return finishRun(controller.run(options.input, options.output), options);
        }
        case Command::Pipeline: {
            services::BatchController controller(
                options.batch, services::BatchController::pipelineRunner(pipeline, *config));
            services::TwoStageDriver driver(
                std::move(controller),
                std::make_shared<services::ObjectIsolator>(makeSelector(options)));
            return finishRun(driver.run(options.input, options.output, options.keepIntermediate),
                             options);
        }
        default:
            return exit_code::UsageError;
    }
}

}  // namespace dicom_mesher::app
