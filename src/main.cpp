/**
 * Flux - Adaptive multi-connection downloader
 *
 * Headless command line front end: downloads one URL through the
 * transfer engine and logs its events.
 *
 * @version 1.0.0
 */

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/downloader/TransferEngine.hpp"
#include "utils/PathUtils.hpp"

namespace fs = std::filesystem;

using flux::core::Config;
using flux::core::Logger;
using flux::core::LogLevel;
using namespace flux::core::downloader;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

/**
 * Signal handler: the main loop pauses the task
 */
void signalHandler(int) {
    g_interrupted = 1;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

struct CommandLine {
    std::string url;
    fs::path outputDir;
    std::optional<std::string> filename;
    fs::path configPath;
    fs::path exportDecisionsPath;
    bool verbose{false};
};

void printUsage(const char* program) {
    std::cout << "Flux - Adaptive multi-connection downloader\n"
              << "\nUsage: " << program << " download <url> [options]\n"
              << "\nOptions:\n"
              << "  -o, --output <dir>            Output directory\n"
              << "  -f, --filename <name>         Override the detected filename\n"
              << "  --config <file>               Configuration file\n"
              << "  --export-decisions <file>     Write the adaptive decision history as JSON\n"
              << "  -v, --verbose                 Debug logging\n"
              << "  -h, --help                    Show this help message\n"
              << "  --version                     Show version information\n"
              << std::endl;
}

/**
 * @return Parsed arguments, or nullopt when the program should exit
 */
std::optional<CommandLine> parseArguments(int argc, char* argv[], int& exitCode) {
    CommandLine cli;
    exitCode = 0;

    auto takeValue = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << std::endl;
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    bool sawCommand = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return std::nullopt;
        } else if (arg == "--version") {
            std::cout << "Flux v1.0.0" << std::endl;
            return std::nullopt;
        } else if (arg == "--verbose" || arg == "-v") {
            cli.verbose = true;
        } else if (arg == "--output" || arg == "-o" || arg == "--filename" || arg == "-f"
                   || arg == "--config" || arg == "--export-decisions") {
            auto value = takeValue(i, arg);
            if (!value) {
                exitCode = 2;
                return std::nullopt;
            }
            if (arg == "--output" || arg == "-o") cli.outputDir = *value;
            else if (arg == "--filename" || arg == "-f") cli.filename = *value;
            else if (arg == "--config") cli.configPath = *value;
            else cli.exportDecisionsPath = *value;
        } else if (!sawCommand) {
            if (arg != "download") {
                std::cerr << "Unknown command: " << arg << std::endl;
                exitCode = 2;
                return std::nullopt;
            }
            sawCommand = true;
        } else if (cli.url.empty()) {
            cli.url = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            exitCode = 2;
            return std::nullopt;
        }
    }

    if (!sawCommand || cli.url.empty()) {
        printUsage(argv[0]);
        exitCode = 2;
        return std::nullopt;
    }

    return cli;
}

enum class ConfigOutcome {
    Loaded,
    Created,
    NotSaved,
    Invalid
};

/**
 * Load configuration, creating a default file when absent.
 * Runs before the logger exists; the caller logs the outcome.
 */
ConfigOutcome loadConfiguration(const fs::path& configPath) {
    auto& config = Config::instance();

    if (fs::exists(configPath)) {
        return config.load(configPath.string()) ? ConfigOutcome::Loaded : ConfigOutcome::Invalid;
    }

    config.setDefaults();
    return config.save(configPath.string()) ? ConfigOutcome::Created : ConfigOutcome::NotSaved;
}

void logEvent(const std::string& event, const json& payload) {
    if (event == "download_progress") {
        FLUX_LOG_INFO("{} / {} bytes, {:.0f} B/s, eta {:.1f} s",
                      payload.value("bytes_downloaded", uint64_t{0}),
                      payload.value("total_size", uint64_t{0}),
                      payload.value("speed", 0.0),
                      payload.value("eta", 0.0));
    } else if (event == "download_failed") {
        FLUX_LOG_ERROR("Download failed: {}", payload.value("error", std::string{}));
    } else {
        FLUX_LOG_DEBUG("Event {}: {}", event, payload.dump());
    }
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    int exitCode = 0;
    auto cli = parseArguments(argc, argv, exitCode);
    if (!cli) {
        return exitCode;
    }

    // Configuration first: it names the log level and directory
    fs::path configPath = cli->configPath.empty() ? flux::utils::PathUtils::getConfigPath() : cli->configPath;
    ConfigOutcome outcome = loadConfiguration(configPath);
    auto& config = Config::instance();

    LogLevel level = cli->verbose
        ? LogLevel::Debug
        : Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    std::string logDir = config.get<std::string>("logging.directory", "");
    Logger::instance().initialize(level, logDir.empty() ? flux::utils::PathUtils::getLogsPath().string() : logDir);

    FLUX_LOG_INFO("Flux v1.0.0 starting");

    switch (outcome) {
        case ConfigOutcome::Loaded:
            FLUX_LOG_INFO("Configuration loaded from {}", configPath.string());
            break;
        case ConfigOutcome::Created:
            FLUX_LOG_INFO("Default configuration created at {}", configPath.string());
            break;
        case ConfigOutcome::NotSaved:
            FLUX_LOG_WARN("Cannot write default configuration to {}", configPath.string());
            break;
        case ConfigOutcome::Invalid:
            FLUX_LOG_CRITICAL("Invalid configuration file {}", configPath.string());
            return 1;
    }

    setupSignalHandlers();

    auto engineOptions = EngineOptions::fromConfig(config);
    if (!cli->outputDir.empty()) {
        engineOptions.outputDirectory = cli->outputDir;
    } else if (engineOptions.outputDirectory.empty()) {
        engineOptions.outputDirectory = flux::utils::PathUtils::getDownloadsPath();
    }

    TransferEngine engine(engineOptions,
                          ClientOptions::fromConfig(config),
                          DecisionPolicy::fromConfig(config));
    auto subscription = engine.subscribe(logEvent);

    int result = 1;
    try {
        engine.start();

        std::string id = engine.addTask(cli->url, {}, cli->filename);

        while (!engine.waitForTask(id, std::chrono::milliseconds(200))) {
            if (g_interrupted) {
                FLUX_LOG_INFO("Interrupted, pausing download (resume by running the same command)");
                engine.pauseTask(id);
                break;
            }
        }

        auto task = engine.getTask(id);
        if (task && task->status == TransferStatus::Completed) {
            FLUX_LOG_INFO("Saved {} ({} bytes)", task->destination.string(), task->metrics.bytesDownloaded());
            result = 0;
        } else if (task && task->status == TransferStatus::Failed) {
            FLUX_LOG_ERROR("Download failed: {}", task->error);
        }
    } catch (const std::exception& e) {
        FLUX_LOG_CRITICAL("Download aborted: {}", e.what());
    }

    if (!cli->exportDecisionsPath.empty() && engine.exportDecisionsToFile(cli->exportDecisionsPath)) {
        FLUX_LOG_INFO("Decision history written to {}", cli->exportDecisionsPath.string());
    }

    engine.unsubscribe(subscription);
    engine.stop();

    FLUX_LOG_INFO("Flux shutdown complete");
    Logger::instance().flush();
    return result;
}
