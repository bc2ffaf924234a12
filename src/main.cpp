#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "CacheRunner.hpp"
#include "ConfigParser.hpp"
#include "Logging.hpp"

namespace {
constexpr char kDefaultSettingsPath[] = "/mnt/user/system/cachekeeper/cachekeeper_settings.json";

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <file>] [--dry-run|--debug] [--skip-cache]" << std::endl;
}
} // namespace

int main(int argc, char* argv[]) {
    std::string settingsPath = kDefaultSettingsPath;
    RunOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--dry-run" || arg == "--debug") {
            options.dryRun = true;
        } else if (arg == "--skip-cache") {
            options.skipCache = true;
        } else if (arg == "--config" && i + 1 < argc) {
            settingsPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            std::cerr << "Unknown argument `" << arg << "`." << std::endl;
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    const auto startTime = std::chrono::steady_clock::now();
    std::cout << "*** CacheKeeper ***" << std::endl;

    ConfigParser parser;
    if (!parser.load(settingsPath)) {
        std::cerr << "Failed to load configuration. Exiting." << std::endl;
        return EXIT_FAILURE;
    }
    const Settings& settings = parser.getSettings();

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = makeLogger({settings.logsFolder, options.dryRun ? "debug" : settings.logLevel, settings.maxLogFiles});
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    logger->info("*** CacheKeeper ***");

    CacheRunner runner(settings, options, logger);
    try {
        const std::size_t errors = runner.run();
        if (errors > 0) {
            logger->warn("{} file(s) could not be moved; see the log for details.", errors);
        }
    } catch (const std::exception& e) {
        logger->critical("Application error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        logger->flush();
        return EXIT_FAILURE;
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime);
    const std::string executionTime = formatDuration(elapsed);
    runner.summary().add("The script took approximately " + executionTime + " to execute.");
    runner.summary().log(*logger);

    std::cout << "Execution time of the script: " << executionTime << std::endl;
    logger->info("Execution time of the script: {}", executionTime);
    logger->info("*** The End ***");
    logger->flush();
    std::cout << "*** The End ***" << std::endl;
    return EXIT_SUCCESS;
}
