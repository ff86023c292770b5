#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <json/json.h>

#include "Config.h"
#include "Constants.h"
#include "DiscoveryProvider.h"
#include "FileStorageBackend.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PathUtils.h"
#include "ReassemblyManager.h"
#include "SignalingClient.h"
#include "TransferManifest.h"
#include "TransferProgressStore.h"
#include "Version.h"

using namespace Tessera;
using namespace Tessera::Signaling;
using namespace Tessera::Transfer;

namespace {

    bool isNonNegativeInt(const std::string&, const std::string& value) {
        try {
            size_t used = 0;
            long parsed = std::stol(value, &used);
            return used == value.size() && parsed >= 0;
        } catch (const std::logic_error&) {
            return false;
        }
    }

    bool isBool(const std::string&, const std::string& value) {
        return value == "true" || value == "false" || value == "1" || value == "0" ||
               value == "yes" || value == "no" || value == "on" || value == "off";
    }

    bool isEndpoint(const std::string&, const std::string& value) {
        return static_cast<bool>(Endpoint::parse(value));
    }

    bool isEndpointList(const std::string&, const std::string& value) {
        Config probe;
        probe.set("list", value);
        return static_cast<bool>(StaticDiscoveryProvider::parseList(probe.getList("list")));
    }

    void printUsage(const char* argv0) {
        std::cout << Version::banner("peer") << std::endl;
        std::cout << "\nUsage:" << std::endl;
        std::cout << "  " << argv0 << " connect [OPTIONS]      Interactive signaling session" << std::endl;
        std::cout << "  " << argv0 << " assemble [OPTIONS]     Reassemble a file from received chunks" << std::endl;
        std::cout << "\nCommon options:" << std::endl;
        std::cout << "  --config <PATH>               Config file (default: ~/.config/tessera/peer.conf)" << std::endl;
        std::cout << "  --log-file <PATH>             Also log to this file" << std::endl;
        std::cout << "  --log-level <LEVEL>           debug, info, warn, error or critical (default: warn)" << std::endl;
        std::cout << "\nconnect options:" << std::endl;
        std::cout << "  --relay <URL>                 Relay endpoint (default: tcp://localhost:9000)" << std::endl;
        std::cout << "  --prefer-dht                  Ask the discovery provider for a relay first" << std::endl;
        std::cout << "  --discovery <URL,...>         Relays known to the discovery provider" << std::endl;
        std::cout << "  --connect-timeout-ms <MS>     Give up connecting after MS (default: 0 = never)" << std::endl;
        std::cout << "  --heartbeat-ms <MS>           Ping interval (default: 30000, 0 = off)" << std::endl;
        std::cout << "\nassemble options:" << std::endl;
        std::cout << "  --manifest <PATH>             Transfer manifest (JSON)" << std::endl;
        std::cout << "  --chunks <DIR>                Directory holding <index>.chunk files" << std::endl;
        std::cout << "  --out <PATH>                  Destination file" << std::endl;
        std::cout << "  --transfer-id <ID>            Resume key (default: destination path)" << std::endl;
        std::cout << "  --digest <SHA256>             Expected SHA-256 of the assembled file" << std::endl;
        std::cout << "  --progress-db <PATH>          Resume database (\"\" disables)" << std::endl;
        std::cout << "\nInteractive commands: peers | send <peer> <text> | id | quit" << std::endl;
    }

    void configureLogging(const Config& config) {
        auto& logger = Logger::instance();
        logger.setLevel(Logger::parseLevel(config.get("log_level", "warn")));
        logger.setMaxFileSize(tsr::config::MAX_LOG_FILE_SIZE_MB);

        std::string logFile = PathUtils::expandTilde(config.get("log_file", ""));
        if (logFile.empty()) {
            return;
        }
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

    ClientOptions clientOptionsFromConfig(const Config& config) {
        ClientOptions options;
        options.url = config.get("relay_url", tsr::config::DEFAULT_RELAY_URL);
        options.preferDht = config.getBool("prefer_dht", false);
        options.connectTimeout = std::chrono::milliseconds(config.getInt("connect_timeout_ms", 0));
        options.heartbeatInterval = std::chrono::milliseconds(
            config.getInt("heartbeat_interval_ms", tsr::config::HEARTBEAT_INTERVAL_MS));
        options.reconnect.baseDelay = std::chrono::milliseconds(
            config.getInt("reconnect_base_ms", tsr::config::RECONNECT_BASE_DELAY_MS));
        options.reconnect.maxDelay = std::chrono::milliseconds(
            config.getInt("reconnect_max_ms", tsr::config::RECONNECT_MAX_DELAY_MS));
        options.reconnect.jitter = std::chrono::milliseconds(
            config.getInt("reconnect_jitter_ms", tsr::config::RECONNECT_JITTER_MS));

        auto relays = StaticDiscoveryProvider::parseList(config.getList("discovery_relays"));
        if (relays && !relays->empty()) {
            options.discovery = std::make_shared<StaticDiscoveryProvider>(std::move(*relays));
        }
        return options;
    }

    std::string joinIds(const std::vector<std::string>& ids) {
        if (ids.empty()) return "(none)";
        std::string joined;
        for (const auto& id : ids) {
            if (!joined.empty()) joined += ", ";
            joined += id;
        }
        return joined;
    }

    // ------------------------------------------------------------------
    // connect
    // ------------------------------------------------------------------

    int runConnect(const Config& config) {
        SignalingClient client(clientOptionsFromConfig(config));
        std::cout << "Client id: " << client.getClientId() << std::endl;

        client.connectionState().subscribe([](const ConnectionState& state) {
            std::cout << "[status] " << connectionStateName(state) << std::endl;
        });
        client.peers().subscribe([](const std::vector<std::string>& peers) {
            std::cout << "[peers] " << joinIds(peers) << std::endl;
        });
        client.setOnMessage([](const std::string& from, const Json::Value& payload) {
            if (payload.isObject() && payload.isMember("text") && payload["text"].isString()) {
                std::cout << "[" << from << "] " << payload["text"].asString() << std::endl;
            } else {
                Json::StreamWriterBuilder builder;
                builder["indentation"] = "";
                std::cout << "[" << from << "] " << Json::writeString(builder, payload) << std::endl;
            }
        });

        auto connected = client.connect();
        if (!connected) {
            std::cerr << "Failed to connect: " << connected.error().message << std::endl;
            return 1;
        }

        std::string line;
        while (std::getline(std::cin, line)) {
            std::istringstream input(line);
            std::string command;
            input >> command;

            if (command.empty()) {
                continue;
            } else if (command == "quit" || command == "exit") {
                break;
            } else if (command == "id") {
                std::cout << client.getClientId() << std::endl;
            } else if (command == "peers") {
                std::cout << joinIds(client.peers().get()) << std::endl;
            } else if (command == "send") {
                std::string to;
                input >> to;
                std::string text;
                std::getline(input, text);
                if (!text.empty() && text[0] == ' ') text.erase(0, 1);
                if (to.empty()) {
                    std::cerr << "usage: send <peer> <text>" << std::endl;
                    continue;
                }
                Json::Value payload;
                payload["text"] = text;
                client.send(to, payload);
                if (!client.isConnected()) {
                    std::cout << "(queued, " << client.outboxSize() << " pending)" << std::endl;
                }
            } else {
                std::cerr << "Unknown command: " << command << std::endl;
            }
        }

        client.disconnect();
        return 0;
    }

    // ------------------------------------------------------------------
    // assemble
    // ------------------------------------------------------------------

    std::optional<std::vector<uint8_t>> readChunkFile(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    int runAssemble(const Config& config) {
        auto& logger = Logger::instance();

        std::string manifestPath = PathUtils::expandTilde(config.get("manifest", ""));
        std::string chunkDir = PathUtils::expandTilde(config.get("chunks", ""));
        std::string outPath = PathUtils::expandTilde(config.get("out", ""));
        if (manifestPath.empty() || chunkDir.empty() || outPath.empty()) {
            std::cerr << "Error: assemble needs --manifest, --chunks and --out" << std::endl;
            return 1;
        }

        auto manifest = TransferManifest::loadFromFile(manifestPath);
        if (!manifest) {
            std::cerr << "Error: " << manifest.error().message << std::endl;
            return 1;
        }

        TransferProgressStore progress;
        std::string progressDb = config.hasKey("progress_db")
            ? PathUtils::expandTilde(config.get("progress_db"))
            : PathUtils::getProgressDatabasePath().string();
        if (!progressDb.empty()) {
            try {
                auto parent = std::filesystem::path(progressDb).parent_path();
                if (!parent.empty()) {
                    PathUtils::ensureDirectory(parent);
                }
                auto opened = progress.open(progressDb);
                if (!opened) {
                    logger.warn("Resume disabled: " + opened.error().message, "Peer");
                }
            } catch (const std::runtime_error& e) {
                logger.warn(std::string("Resume disabled: ") + e.what(), "Peer");
            }
        }

        FileStorageBackend backend(FileStorageBackend::Options{config.getBool("sync_writes", false)});
        ReassemblyManager manager(backend, progress.isOpen() ? &progress : nullptr);

        std::string transferId = config.get("transfer_id", outPath);
        std::string stagingPath = outPath + ".part";
        auto initialized = manager.resumeReassembly(transferId, *manifest, stagingPath);
        if (!initialized) {
            std::cerr << "Error: " << initialized.error().message << std::endl;
            return 1;
        }

        size_t resumed = manifest->chunkCount() - manager.missingChunks(transferId).size();
        if (resumed > 0) {
            std::cout << "Resuming: " << resumed << "/" << manifest->chunkCount() << " chunks already stored" << std::endl;
        }

        size_t accepted = 0;
        size_t missing = 0;
        for (size_t index : manager.missingChunks(transferId)) {
            auto chunkPath = std::filesystem::path(chunkDir) / (std::to_string(index) + ".chunk");
            auto data = readChunkFile(chunkPath);
            if (!data) {
                ++missing;
                continue;
            }
            if (manager.acceptChunk(transferId, index, *data)) {
                ++accepted;
            }
        }

        auto state = manager.getState(transferId);
        if (!state) {
            std::cerr << "Error: transfer state vanished" << std::endl;
            return 1;
        }
        std::cout << "Accepted " << accepted << " chunks, " << state->receivedChunks.size() << "/"
                  << manifest->chunkCount() << " received, " << state->corruptedChunks.size()
                  << " corrupted, " << missing << " missing" << std::endl;

        if (!manager.isComplete(transferId)) {
            auto outstanding = manager.missingChunks(transferId);
            std::cerr << "Transfer incomplete; re-request chunks:";
            for (size_t index : outstanding) {
                std::cerr << " " << index;
            }
            std::cerr << std::endl;
            return 2;
        }

        std::optional<std::string> digest;
        if (config.hasKey("digest")) {
            digest = config.get("digest");
        }
        if (!manager.finalize(transferId, outPath, digest)) {
            std::cerr << "Error: finalize failed, staged data kept at " << stagingPath << std::endl;
            return 1;
        }

        std::cout << "Wrote " << outPath << std::endl;
        auto metrics = MetricsCollector::instance().getTransferMetrics();
        logger.info("Persisted " + std::to_string(metrics.bytesPersisted) + " bytes", "Peer");
        return 0;
    }

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);
    Logger::instance().setComponent("Peer");

    if (argc < 2 || std::string(argv[1]) == "--help") {
        printUsage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    std::string command = argv[1];
    if (command != "connect" && command != "assemble") {
        std::cerr << "Error: unknown command '" << command << "'" << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    // --- Config file first, flags override ---
    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            configPath = PathUtils::expandTilde(argv[++i]);
        }
    }

    bool explicitConfig = !configPath.empty();
    if (!explicitConfig) {
        try {
            configPath = PathUtils::getConfigFile("peer").string();
        } catch (const std::runtime_error& e) {
            Logger::instance().debug(std::string("No default config location: ") + e.what(), "Peer");
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

    static const std::unordered_map<std::string, std::string> flagKeys = {
        {"--relay", "relay_url"},
        {"--discovery", "discovery_relays"},
        {"--connect-timeout-ms", "connect_timeout_ms"},
        {"--heartbeat-ms", "heartbeat_interval_ms"},
        {"--log-file", "log_file"},
        {"--log-level", "log_level"},
        {"--manifest", "manifest"},
        {"--chunks", "chunks"},
        {"--out", "out"},
        {"--transfer-id", "transfer_id"},
        {"--digest", "digest"},
        {"--progress-db", "progress_db"},
    };

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (arg == "--prefer-dht") {
            config.setBool("prefer_dht", true);
            continue;
        }
        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }

        auto flag = flagKeys.find(arg);
        if (flag == flagKeys.end() || i + 1 >= argc) {
            std::cerr << "Error: unknown or incomplete option '" << arg << "'" << std::endl;
            printUsage(argv[0]);
            return 1;
        }
        config.set(flag->second, argv[++i]);
    }

    std::string badKey;
    const std::unordered_map<std::string, Config::Validator> schema = {
        {"relay_url", isEndpoint},
        {"prefer_dht", isBool},
        {"discovery_relays", isEndpointList},
        {"connect_timeout_ms", isNonNegativeInt},
        {"heartbeat_interval_ms", isNonNegativeInt},
        {"reconnect_base_ms", isNonNegativeInt},
        {"reconnect_max_ms", isNonNegativeInt},
        {"reconnect_jitter_ms", isNonNegativeInt},
        {"sync_writes", isBool},
    };
    if (!config.validate(schema, &badKey)) {
        std::cerr << "Error: invalid value for " << badKey << ": '" << config.get(badKey) << "'" << std::endl;
        return 1;
    }

    configureLogging(config);
    Logger::instance().info(Version::banner("peer") + " (" + command + ")", "Peer");

    return command == "connect" ? runConnect(config) : runAssemble(config);
}
