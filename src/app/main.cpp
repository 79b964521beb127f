#include "app/command_line.hpp"

#include <cstdio>
#include <exception>

#include "core/logging.hpp"

/**
 * @brief Application entry point
 *
 * Parses the command line, sets up logging and runs the command.
 */
int main(int argc, char* argv[])
{
    using namespace dicom_mesher;

    auto parsed = app::parseCommandLine(argc, argv);
    if (!parsed) {
        std::fprintf(stderr, "dicom_mesher: %s\nTry 'dicom_mesher --help'.\n",
                     parsed.error().message.c_str());
        return app::exit_code::UsageError;
    }

    logging::LogConfig logConfig;
    logConfig.consoleLevel = logging::levelForVerbosity(parsed->verbosity);
    if (parsed->logDirectory) {
        logConfig.enableFileLogging = true;
        logConfig.logDirectory = *parsed->logDirectory;
    }
    if (!logging::LoggerFactory::configure(logConfig)) {
        std::fprintf(stderr, "dicom_mesher: cannot open a log file in %s\n",
                     logConfig.logDirectory.string().c_str());
        return app::exit_code::UsageError;
    }

    auto logger = logging::LoggerFactory::create("dicom_mesher");
    if (auto logFile = logging::LoggerFactory::currentLogFile()) {
        logger->info("Logging to {}", logFile->string());
    }

    int status = app::exit_code::AllFailed;
    try {
        status = app::runCommand(*parsed);
    } catch (const std::exception& e) {
        logger->critical("Unhandled exception: {}", e.what());
    }

    logging::LoggerFactory::shutdown();
    return status;
}
