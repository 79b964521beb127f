#include "core/logging.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dicom_mesher::logging {

LogConfig LoggerFactory::config_ = {};

namespace {

struct SharedSinks {
    std::mutex mutex;
    spdlog::sink_ptr console;
    spdlog::sink_ptr file;
    std::optional<std::filesystem::path> filePath;
};

SharedSinks& sharedSinks() {
    static SharedSinks sinks;
    return sinks;
}

spdlog::level::level_enum toSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

std::vector<spdlog::sink_ptr> activeSinks(SharedSinks& shared, const LogConfig& config) {
    if (!shared.console) {
        shared.console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        shared.console->set_level(toSpdlog(config.consoleLevel));
        shared.console->set_pattern(config.pattern);
    }
    std::vector<spdlog::sink_ptr> sinks{shared.console};
    if (shared.file) {
        sinks.push_back(shared.file);
    }
    return sinks;
}

spdlog::level::level_enum loggerLevel(const LogConfig& config, bool hasFile) {
    if (!hasFile) {
        return toSpdlog(config.consoleLevel);
    }
    return std::min(toSpdlog(config.consoleLevel), toSpdlog(config.fileLevel));
}

std::string runTimestamp() {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%Y%m%d_%H%M%S}", now);
}

}  // namespace

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    auto existingLogger = spdlog::get(name);
    if (existingLogger) {
        return existingLogger;
    }

    auto& shared = sharedSinks();
    std::lock_guard lock(shared.mutex);

    auto sinks = activeSinks(shared, config_);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(loggerLevel(config_, shared.file != nullptr));

    spdlog::register_logger(logger);

    return logger;
}

bool LoggerFactory::configure(const LogConfig& config) {
    auto& shared = sharedSinks();
    std::lock_guard lock(shared.mutex);

    config_ = config;

    shared.console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    shared.console->set_level(toSpdlog(config.consoleLevel));
    shared.console->set_pattern(config.pattern);

    shared.file.reset();
    shared.filePath.reset();

    bool ok = true;
    if (config.enableFileLogging && !config.logDirectory.empty()) {
        try {
            std::filesystem::create_directories(config.logDirectory);
            auto logFile = config.logDirectory /
                (config.filePrefix + "_" + runTimestamp() + ".log");
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(),
                config.maxFileSize,
                config.maxFiles
            );
            fileSink->set_level(toSpdlog(config.fileLevel));
            fileSink->set_pattern(config.pattern);
            shared.file = fileSink;
            shared.filePath = logFile;
        } catch (const spdlog::spdlog_ex& e) {
            shared.console->log(spdlog::details::log_msg(
                "logging", spdlog::level::err,
                std::string("Cannot open run log file: ") + e.what()));
            ok = false;
        } catch (const std::filesystem::filesystem_error& e) {
            shared.console->log(spdlog::details::log_msg(
                "logging", spdlog::level::err,
                std::string("Cannot create log directory: ") + e.what()));
            ok = false;
        }
    }

    auto sinks = activeSinks(shared, config_);
    const auto level = loggerLevel(config_, shared.file != nullptr);
    spdlog::apply_all([&sinks, level](std::shared_ptr<spdlog::logger> logger) {
        logger->sinks() = sinks;
        logger->set_level(level);
    });

    return ok;
}

std::optional<std::filesystem::path> LoggerFactory::currentLogFile() {
    auto& shared = sharedSinks();
    std::lock_guard lock(shared.mutex);
    return shared.filePath;
}

void LoggerFactory::shutdown() {
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> logger) {
        logger->flush();
    });
    spdlog::shutdown();

    auto& shared = sharedSinks();
    std::lock_guard lock(shared.mutex);
    shared.console.reset();
    shared.file.reset();
    shared.filePath.reset();
}

LogLevel levelForVerbosity(int verbosity) {
    if (verbosity <= 0) return LogLevel::Info;
    if (verbosity == 1) return LogLevel::Debug;
    return LogLevel::Trace;
}

}  // namespace dicom_mesher::logging
