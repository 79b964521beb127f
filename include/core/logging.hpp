#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace dicom_mesher::logging {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warning = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

/**
 * @brief Run-wide logging configuration
 *
 * All named loggers share one console sink and, when a log directory is
 * set, one run log file named `<filePrefix>_<YYYYmmdd_HHMMSS>.log`.
 */
struct LogConfig {
    LogLevel consoleLevel = LogLevel::Info;
    LogLevel fileLevel = LogLevel::Debug;
    bool enableFileLogging = false;
    std::filesystem::path logDirectory = "logs";
    std::string filePrefix = "dicom_mesher";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    size_t maxFileSize = 20 * 1024 * 1024;  // 20 MB
    size_t maxFiles = 3;
};

class LoggerFactory {
public:
    /// Returns the logger registered under @p name, creating it on first use
    static std::shared_ptr<spdlog::logger> create(const std::string& name);

    /**
     * @brief Replace the run configuration
     *
     * Rebuilds the shared sinks and re-attaches every logger created so far.
     * Fails only when the run log file cannot be opened.
     */
    static bool configure(const LogConfig& config);

    /// Path of the current run log file, if file logging is active
    static std::optional<std::filesystem::path> currentLogFile();

    static void shutdown();

private:
    static LogConfig config_;
};

/// Console level for a repeated -v flag count (0 = info, 1 = debug, 2+ = trace)
LogLevel levelForVerbosity(int verbosity);

}  // namespace dicom_mesher::logging
