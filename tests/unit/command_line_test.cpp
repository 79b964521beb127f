#include "app/command_line.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace dicom_mesher::app {
namespace {

namespace fs = std::filesystem;

/// argv holder; argv[0] is the program name
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_{"dicom_mesher"} {
        storage_.insert(storage_.end(), args.begin(), args.end());
        for (const auto& s : storage_) {
            pointers_.push_back(s.c_str());
        }
    }

    [[nodiscard]] int argc() const { return static_cast<int>(pointers_.size()); }
    [[nodiscard]] const char* const* argv() const { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<const char*> pointers_;
};

std::expected<CommandLineOptions, CommandLineError> parse(std::initializer_list<std::string> args)
{
    Args a(args);
    return parseCommandLine(a.argc(), a.argv());
}

// =============================================================================
// Threshold lists
// =============================================================================

TEST(ParseThresholdListTest, SemicolonSeparated) {
    auto values = parseThresholdList("150;800;1500;2000");
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(*values, (std::vector<double>{150, 800, 1500, 2000}));
}

TEST(ParseThresholdListTest, CommaSeparatedWithSpaces) {
    auto values = parseThresholdList("-15, 30, 58, 100");
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(*values, (std::vector<double>{-15, 30, 58, 100}));
}

TEST(ParseThresholdListTest, WrongCount) {
    auto values = parseThresholdList("1;2;3");
    ASSERT_FALSE(values.has_value());
    EXPECT_NE(values.error().message.find("4 values"), std::string::npos);
}

TEST(ParseThresholdListTest, NotANumber) {
    EXPECT_FALSE(parseThresholdList("1;2;x;4").has_value());
    EXPECT_FALSE(parseThresholdList("1;;3;4").has_value());
}

// =============================================================================
// Command line
// =============================================================================

TEST(ParseCommandLineTest, NoArgumentsMeansHelp) {
    auto options = parse({});
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->command, Command::Help);
    EXPECT_NE(options->helpText.find("--output"), std::string::npos);
}

TEST(ParseCommandLineTest, VersionNeedsNoInput) {
    auto options = parse({"version"});
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->command, Command::Version);
}

TEST(ParseCommandLineTest, UnknownCommand) {
    auto options = parse({"render", "in", "-o", "out"});
    ASSERT_FALSE(options.has_value());
    EXPECT_NE(options.error().message.find("render"), std::string::npos);
}

TEST(ParseCommandLineTest, MissingOutput) {
    auto options = parse({"convert", "/data/study"});
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error().message, "Missing --output");
}

TEST(ParseCommandLineTest, ConvertWithTissue) {
    auto options = parse({"convert", "/data/study", "-o", "/out/skull.stl", "-t", "bone", "-a", "-m"});
    ASSERT_TRUE(options.has_value());

    EXPECT_EQ(options->command, Command::Convert);
    EXPECT_EQ(options->input, fs::path("/data/study"));
    EXPECT_EQ(options->output, fs::path("/out/skull.stl"));
    EXPECT_EQ(options->overrides.tissue, "bone");
    EXPECT_EQ(options->overrides.anisotropic, true);
    EXPECT_EQ(options->overrides.writeVolumeInfo, true);
    EXPECT_FALSE(options->overrides.isoValue.has_value());
}

TEST(ParseCommandLineTest, UnsetFlagsLeaveLayerEmpty) {
    auto options = parse({"convert", "in", "-o", "out.stl"});
    ASSERT_TRUE(options.has_value());
    EXPECT_FALSE(options->overrides.anisotropic.has_value());
    EXPECT_FALSE(options->overrides.requireCT.has_value());
    EXPECT_FALSE(options->overrides.smoothingIterations.has_value());
}

TEST(ParseCommandLineTest, VerbosityCounts) {
    auto one = parse({"-v", "convert", "in", "-o", "out.stl"});
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one->verbosity, 1);

    auto three = parse({"convert", "-vv", "in", "--verbose", "-o", "out.stl"});
    ASSERT_TRUE(three.has_value());
    EXPECT_EQ(three->verbosity, 3);
    EXPECT_EQ(three->input, fs::path("in"));
}

TEST(ParseCommandLineTest, DoubleThresholds) {
    auto options = parse({"convert", "in", "-o", "out.stl", "-d", "150;800;1500;2000"});
    ASSERT_TRUE(options.has_value());
    ASSERT_TRUE(options->overrides.thresholds.has_value());
    EXPECT_EQ(options->overrides.thresholds->size(), 4u);

    EXPECT_FALSE(parse({"convert", "in", "-o", "out.stl", "-d", "150;800"}).has_value());
}

TEST(ParseCommandLineTest, RotationAxisAndAngleDoNotEnableRotation) {
    auto options = parse({"convert", "in", "-o", "out.stl", "--rotaxis", "2", "--rotangle", "90"});
    ASSERT_TRUE(options.has_value());
    EXPECT_FALSE(options->overrides.rotation.has_value());
    EXPECT_EQ(options->overrides.rotationAxis, 2);
    EXPECT_EQ(options->overrides.rotationAngle, 90.0);

    auto enabled = parse({"convert", "in", "-o", "out.stl",
                          "--rotaxis", "2", "--rotangle", "90", "--enable", "rotation"});
    ASSERT_TRUE(enabled.has_value());
    EXPECT_EQ(enabled->overrides.rotation, true);
}

TEST(ParseCommandLineTest, EnableAndDisableSwitches) {
    auto options = parse({"convert", "in", "-o", "out.stl",
                          "--enable", "median", "--enable", "largest", "--disable", "shrink"});
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->overrides.median, true);
    EXPECT_EQ(options->overrides.largestRegion, true);
    EXPECT_EQ(options->overrides.shrink, false);

    auto bad = parse({"convert", "in", "-o", "out.stl", "--enable", "turbo"});
    ASSERT_FALSE(bad.has_value());
    EXPECT_NE(bad.error().message.find("turbo"), std::string::npos);
}

TEST(ParseCommandLineTest, NumericRangeChecks) {
    EXPECT_FALSE(parse({"convert", "in", "-o", "o.stl", "--shrink-max", "0"}).has_value());
    EXPECT_FALSE(parse({"convert", "in", "-o", "o.stl", "--pad", "-1"}).has_value());
    EXPECT_FALSE(parse({"convert", "in", "-o", "o.stl", "--smooth", "many"}).has_value());
}

TEST(ParseCommandLineTest, BatchOptions) {
    auto options = parse({"batch", "/studies", "-o", "/meshes", "--dedup",
                          "--prefix", "skull_", "--extension", "ply",
                          "--low-quality-threshold", "100", "--report", "/meshes/report.json"});
    ASSERT_TRUE(options.has_value());

    EXPECT_EQ(options->command, Command::Batch);
    EXPECT_TRUE(options->batch.deduplicatePatients);
    EXPECT_EQ(options->batch.prefix, "skull_");
    EXPECT_EQ(options->batch.extension, ".ply");
    EXPECT_EQ(options->batch.lowQualityThreshold, 100u);
    EXPECT_EQ(options->reportPath, fs::path("/meshes/report.json"));
}

TEST(ParseCommandLineTest, BatchDefaults) {
    auto options = parse({"pipeline", "/studies", "-o", "/meshes"});
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->batch.lowQualityThreshold, 160u);
    EXPECT_FALSE(options->batch.deduplicatePatients);
    EXPECT_EQ(options->batch.extension, ".stl");
    EXPECT_FALSE(options->keepIntermediate);
    EXPECT_EQ(options->selector, SelectorKind::Largest);
}

TEST(ParseCommandLineTest, IsolationSelector) {
    auto options = parse({"isolate", "raw.stl", "-o", "skull.stl",
                          "--selector", "extent", "--min-extent", "80", "--max-extent", "250"});
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->selector, SelectorKind::ExtentRange);
    EXPECT_DOUBLE_EQ(options->minExtent, 80.0);
    EXPECT_DOUBLE_EQ(options->maxExtent, 250.0);

    EXPECT_FALSE(parse({"isolate", "a", "-o", "b", "--selector", "smallest"}).has_value());
    EXPECT_FALSE(parse({"isolate", "a", "-o", "b", "--min-extent", "400"}).has_value());
}

TEST(ParseCommandLineTest, OrganizeOptions) {
    auto options = parse({"organize", "/incoming", "-o", "/sorted",
                          "--modality", "MR", "--body-part", "BRAIN", "--subdirs"});
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->command, Command::Organize);
    EXPECT_EQ(options->organize.modality, "MR");
    EXPECT_EQ(options->organize.bodyPart, "BRAIN");
    EXPECT_TRUE(options->organize.recurseSubdirectories);
}

TEST(ParseCommandLineTest, UnknownOptionIsUsageError) {
    EXPECT_FALSE(parse({"convert", "in", "-o", "out.stl", "--frobnicate"}).has_value());
}

// =============================================================================
// Configuration layering
// =============================================================================

class ResolveConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "dicom_mesher_command_line_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path dir_;
};

TEST_F(ResolveConfigTest, CommandLineBeatsConfigFile) {
    auto file = dir_ / "run.json";
    std::ofstream(file) << R"({"smooth_iterations": 40, "reduction": 0.5, "tissue": "skin"})";

    auto options = parse({"convert", "in", "-o", "out.stl",
                          "--config", file.string(), "--smooth", "10"});
    ASSERT_TRUE(options.has_value());

    auto config = resolveConfig(*options);
    ASSERT_TRUE(config.has_value()) << config.error().toString();
    EXPECT_EQ(config->mesh.smoothingIterations, 10);
    EXPECT_DOUBLE_EQ(config->mesh.decimationReduction, 0.5);
    ASSERT_TRUE(config->preprocess.tissue.has_value());
    EXPECT_EQ(config->preprocess.tissue->name, "skin");
}

TEST_F(ResolveConfigTest, PresetFromCommandLine) {
    auto options = parse({"convert", "in", "-o", "out.stl", "--preset", "skullnet"});
    ASSERT_TRUE(options.has_value());

    auto config = resolveConfig(*options);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->preset, "skullnet");
    EXPECT_FALSE(config->preprocess.shrinkEnabled);
}

TEST_F(ResolveConfigTest, ConflictIsReported) {
    auto options = parse({"convert", "in", "-o", "out.stl", "-t", "bone", "-i", "300"});
    ASSERT_TRUE(options.has_value());

    auto config = resolveConfig(*options);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, services::PipelineError::Code::InvalidConfiguration);
}

TEST_F(ResolveConfigTest, MissingConfigFile) {
    auto options = parse({"convert", "in", "-o", "out.stl", "--config", (dir_ / "absent.json").string()});
    ASSERT_TRUE(options.has_value());
    EXPECT_FALSE(resolveConfig(*options).has_value());
}

TEST(RunCommandTest, HelpAndVersionSucceed) {
    CommandLineOptions help;
    help.command = Command::Help;
    EXPECT_EQ(runCommand(help), exit_code::Success);

    CommandLineOptions version;
    version.command = Command::Version;
    EXPECT_EQ(runCommand(version), exit_code::Success);
}

TEST(RunCommandTest, ConversionOfMissingStudyFails) {
    auto options = parse({"convert", "/nonexistent/study", "-o", "/nonexistent/out.stl"});
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(runCommand(*options), exit_code::AllFailed);
}

}  // namespace
}  // namespace dicom_mesher::app
