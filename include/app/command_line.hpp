#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "services/pipeline/batch_controller.hpp"
#include "services/pipeline/pipeline_config.hpp"
#include "services/pipeline/study_organizer.hpp"

namespace dicom_mesher::app {

enum class Command {
    Convert,
    Batch,
    Isolate,
    Pipeline,
    Organize,
    Help,
    Version
};

enum class SelectorKind {
    Largest,
    ExtentRange
};

/// Process exit status
namespace exit_code {
inline constexpr int Success = 0;
inline constexpr int UsageError = 1;
inline constexpr int SomeFailed = 2;
inline constexpr int AllFailed = 3;
}  // namespace exit_code

/**
 * @brief Parsed command line of the dicom_mesher tool
 */
struct CommandLineOptions {
    Command command = Command::Help;
    std::filesystem::path input;
    std::filesystem::path output;

    std::optional<std::filesystem::path> configFile;
    services::ConfigOverrides overrides;        ///< Command-line layer only

    services::BatchOptions batch;
    bool keepIntermediate = false;
    std::optional<std::filesystem::path> reportPath;

    SelectorKind selector = SelectorKind::Largest;
    double minExtent = 100.0;
    double maxExtent = 300.0;

    services::OrganizeOptions organize;

    int verbosity = 0;
    std::optional<std::filesystem::path> logDirectory;

    std::string helpText;
};

struct CommandLineError {
    std::string message;
};

/**
 * @brief Parse `dicom_mesher <command> [options] <input>`
 *
 * Repeated `-v` (or `-vv`) raises verbosity. Option values are checked for
 * syntax only; cross-option rules are applied by resolveConfig().
 */
[[nodiscard]] std::expected<CommandLineOptions, CommandLineError>
parseCommandLine(int argc, const char* const argv[]);

/// "a;b;c;d" (or comma separated) into numbers
[[nodiscard]] std::expected<std::vector<double>, CommandLineError>
parseThresholdList(const std::string& text);

/**
 * @brief Layer defaults, preset, configuration file and command line
 */
[[nodiscard]] std::expected<services::PipelineConfig, services::PipelineError>
resolveConfig(const CommandLineOptions& options);

/// Run the parsed command and return the process exit status
[[nodiscard]] int runCommand(const CommandLineOptions& options);

}  // namespace dicom_mesher::app
