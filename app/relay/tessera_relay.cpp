#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

#include "Config.h"
#include "Constants.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PathUtils.h"
#include "SignalingServer.h"
#include "Version.h"

using namespace Tessera;
using namespace Tessera::Signaling;

namespace {
    volatile sig_atomic_t signalReceived = 0;
    volatile sig_atomic_t receivedSignalNum = 0;

    void signalHandler(int signal) {
        receivedSignalNum = signal;
        signalReceived = 1;
    }

    bool isNonNegativeInt(const std::string&, const std::string& value) {
        try {
            size_t used = 0;
            long parsed = std::stol(value, &used);
            return used == value.size() && parsed >= 0;
        } catch (const std::logic_error&) {
            return false;
        }
    }

    bool isPort(const std::string& key, const std::string& value) {
        return isNonNegativeInt(key, value) && std::stol(value) <= 65535;
    }

    bool isLogLevel(const std::string&, const std::string& value) {
        static const char* levels[] = {"debug", "info", "warn", "warning", "error", "critical",
                                       "DEBUG", "INFO", "WARN", "WARNING", "ERROR", "CRITICAL"};
        for (const char* level : levels) {
            if (value == level) return true;
        }
        return false;
    }

    void printUsage(const char* argv0) {
        std::cout << Version::banner("relay") << " - signaling relay for Tessera peers" << std::endl;
        std::cout << "\nUsage: " << argv0 << " [OPTIONS]" << std::endl;
        std::cout << "\nOptions:" << std::endl;
        std::cout << "  --config <PATH>               Config file (default: ~/.config/tessera/relay.conf)" << std::endl;
        std::cout << "  --host <ADDR>                 Address to bind (default: 0.0.0.0)" << std::endl;
        std::cout << "  --port <PORT>                 TCP port to listen on (default: 9000, 0 = any)" << std::endl;
        std::cout << "  --handshake-timeout-ms <MS>   Wait for register before assigning an id (default: 5000)" << std::endl;
        std::cout << "  --max-frame-bytes <N>         Largest accepted envelope (default: 10485760)" << std::endl;
        std::cout << "  --log-file <PATH>             Also log to this file" << std::endl;
        std::cout << "  --log-level <LEVEL>           debug, info, warn, error or critical (default: info)" << std::endl;
        std::cout << "  --help                        Show this help message" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setComponent("Relay");

    // --- Locate the config file first so flags can override it ---
    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            configPath = PathUtils::expandTilde(argv[++i]);
        }
    }

    bool explicitConfig = !configPath.empty();
    if (!explicitConfig) {
        try {
            configPath = PathUtils::getConfigFile("relay").string();
        } catch (const std::runtime_error& e) {
            logger.warn(std::string("No default config location: ") + e.what(), "Relay");
        }
    }

    Config config;
    if (!configPath.empty() && std::filesystem::exists(configPath)) {
        if (!config.loadFromFile(configPath)) {
            std::cerr << "Error: cannot read config file " << configPath << std::endl;
            return 1;
        }
    } else if (explicitConfig) {
        std::cerr << "Error: config file " << configPath << " does not exist" << std::endl;
        return 1;
    }

    // --- Parse Command Line Arguments ---
    static const std::unordered_map<std::string, std::string> flagKeys = {
        {"--host", "listen_host"},
        {"--port", "listen_port"},
        {"--handshake-timeout-ms", "handshake_timeout_ms"},
        {"--max-frame-bytes", "max_frame_bytes"},
        {"--log-file", "log_file"},
        {"--log-level", "log_level"},
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            ++i;
            continue;
        }

        auto flag = flagKeys.find(arg);
        if (flag == flagKeys.end() || i + 1 >= argc) {
            std::cerr << "Error: unknown or incomplete option '" << arg << "'" << std::endl;
            printUsage(argv[0]);
            return 1;
        }
        config.set(flag->second, argv[++i]);
    }

    // Validate configuration
    std::string badKey;
    const std::unordered_map<std::string, Config::Validator> schema = {
        {"listen_port", isPort},
        {"handshake_timeout_ms", isNonNegativeInt},
        {"max_frame_bytes", isNonNegativeInt},
        {"log_level", isLogLevel},
    };
    if (!config.validate(schema, &badKey)) {
        std::cerr << "Error: invalid value for " << badKey << ": '" << config.get(badKey) << "'" << std::endl;
        return 1;
    }

    // --- Logging ---
    logger.setLevel(Logger::parseLevel(config.get("log_level", "info")));
    logger.setMaxFileSize(tsr::config::MAX_LOG_FILE_SIZE_MB);
    std::string logFile = PathUtils::expandTilde(config.get("log_file", ""));
    if (!logFile.empty()) {
        try {
            auto parent = std::filesystem::path(logFile).parent_path();
            if (!parent.empty()) {
                PathUtils::ensureDirectory(parent);
            }
            logger.setLogFile(logFile);
        } catch (const std::runtime_error& e) {
            std::cerr << "Warning: " << e.what() << ", logging to console only" << std::endl;
        }
    }

    logger.info("=== " + Version::banner("relay") + " starting ===", "Relay");

    ServerOptions options;
    options.host = config.get("listen_host", "0.0.0.0");
    options.port = config.getInt("listen_port", tsr::config::DEFAULT_RELAY_PORT);
    options.handshakeTimeoutMs = config.getInt("handshake_timeout_ms", tsr::config::HANDSHAKE_TIMEOUT_MS);
    options.maxFrameBytes = config.getSize("max_frame_bytes", tsr::config::MAX_FRAME_BYTES);

    SignalingServer server(options);
    auto started = server.start();
    if (!started) {
        logger.critical("Relay failed to start: " + started.error().message, "Relay");
        std::cerr << "Failed to start relay: " << started.error().message << std::endl;
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "Relay listening on " << options.host << ":" << server.getListeningPort()
              << ". Press Ctrl+C to stop." << std::endl;

    // Main loop - keep alive and handle signals
    while (!signalReceived && server.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (signalReceived) {
        int sigNum = receivedSignalNum;
        logger.info("Received signal " + std::to_string(sigNum) + ", initiating shutdown", "Relay");
    }

    server.stop();
    logger.info(MetricsCollector::instance().getMetricsSummary(), "Relay");
    logger.info("=== Tessera Relay Stopped ===", "Relay");
    return 0;
}
