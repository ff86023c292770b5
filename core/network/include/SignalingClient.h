#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <json/json.h>

#include "Constants.h"
#include "DiscoveryProvider.h"
#include "Envelope.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "Observable.h"
#include "OutboxQueue.h"
#include "ReconnectPolicy.h"
#include "Result.h"
#include "SocketGuard.h"

namespace Tessera {
namespace Signaling {

enum class ConnectionState {
    Disconnected,
    Connecting,     // connect() in progress
    Connected,
    Reconnecting    // connection lost, backoff loop running
};

const char* connectionStateName(ConnectionState state);

/// Where the current connection's endpoint came from
enum class Backend {
    None,
    Relay,          // ClientOptions::url
    Discovery       // IDiscoveryProvider::findRelay()
};

struct ClientOptions {
    std::string url = tsr::config::DEFAULT_RELAY_URL;
    bool preferDht = false;
    std::shared_ptr<IDiscoveryProvider> discovery;

    std::chrono::milliseconds connectTimeout{0};    // 0 = no timeout
    std::chrono::milliseconds heartbeatInterval{tsr::config::HEARTBEAT_INTERVAL_MS};   // 0 = off
    ReconnectPolicy reconnect;
    bool autoReconnect = true;
    size_t maxFrameBytes = tsr::config::MAX_FRAME_BYTES;
};

/**
 * @brief One peer's connection to the signaling relay
 *
 * Manages:
 * - Connection establishment (relay URL or discovery provider)
 * - The observable connection status and peer list
 * - The outbox of messages sent while offline
 * - Heartbeats and reconnection with backoff after an unexpected drop
 *
 * Callbacks (message handler, observers) run on the client's reader or
 * connecting thread. They may call send(), but must not call disconnect().
 */
class SignalingClient {
public:
    using MessageHandler = std::function<void(const std::string& from, const Json::Value& payload)>;

    explicit SignalingClient(ClientOptions options = ClientOptions());
    ~SignalingClient();

    SignalingClient(const SignalingClient&) = delete;
    SignalingClient& operator=(const SignalingClient&) = delete;

    /// Generated at construction, never changes
    const std::string& getClientId() const { return clientId_; }

    /**
     * @brief Make exactly one connection attempt
     *
     * On success the client is registered with the relay, the outbox has
     * been flushed and incoming envelopes are being read. On failure the
     * status stays disconnected and nothing is retried.
     */
    tsr::Result<void> connect();

    /**
     * @brief Send a payload to another client through the relay
     *
     * Never fails: while disconnected (or if the write fails) the payload
     * is queued and delivered, in order, on the next connection.
     */
    void send(const std::string& to, const Json::Value& payload);

    /// Install the single receiver for relayed payloads, replacing the previous one
    void setOnMessage(MessageHandler handler);

    /**
     * @brief Close the connection and cancel reconnection
     *
     * Blocks until the client's threads have stopped; nothing is written
     * to the relay after this returns.
     */
    void disconnect();

    bool isConnected() const { return connected_.get(); }

    size_t outboxSize() const { return outbox_.size(); }

    Observable<bool>& connected() { return connected_; }
    Observable<std::vector<std::string>>& peers() { return peers_; }
    Observable<ConnectionState>& connectionState() { return state_; }
    Observable<Backend>& backend() { return backend_; }

    const ClientOptions& options() const { return options_; }

private:
    struct Connection {
        explicit Connection(tsr::SocketGuard sock) : socket(std::move(sock)) {}

        tsr::SocketGuard socket;
        std::atomic<bool> open{true};
    };
    using ConnectionPtr = std::shared_ptr<Connection>;

    tsr::Result<void> attemptConnection(bool isReconnect);
    /// TCP connect plus the register frame
    tsr::Result<ConnectionPtr> openConnection(const Endpoint& target, Backend via);
    void failAttempt(bool isReconnect);

    /// Write the outbox to conn in order; caller holds sendMutex_
    size_t flushOutbox(const ConnectionPtr& conn);

    /// Caller holds sendMutex_; a failed write shuts the connection down
    bool writeTo(const ConnectionPtr& conn, const Envelope& envelope);

    ConnectionPtr currentConnection();

    void readLoop(ConnectionPtr conn);
    void dispatch(const ConnectionPtr& conn, const Envelope& envelope);
    void deliver(const std::string& from, const Json::Value& payload);
    void onConnectionLost(const ConnectionPtr& conn);

    void reconnectLoop();
    void heartbeatLoop();

    static void joinThread(std::thread& thread);

    ClientOptions options_;
    const std::string clientId_;

    Logger& logger_{Logger::instance()};
    MetricsCollector& metrics_{MetricsCollector::instance()};

    Observable<bool> connected_{false};
    Observable<std::vector<std::string>> peers_;
    Observable<ConnectionState> state_{ConnectionState::Disconnected};
    Observable<Backend> backend_{Backend::None};

    OutboxQueue outbox_;

    std::mutex handlerMutex_;
    MessageHandler onMessage_;

    // Lock order: attemptMutex_ -> notifyMutex_ -> sendMutex_ -> stateMutex_
    std::mutex attemptMutex_;               // one connection attempt at a time
    std::recursive_mutex notifyMutex_;      // observable updates, in order
    std::mutex sendMutex_;                  // frames on the current connection
    std::mutex stateMutex_;                 // everything below
    std::condition_variable stateCv_;

    ConnectionPtr connection_;
    bool manualClose_ = false;
    bool reconnecting_ = false;
    std::thread readThread_;
    std::thread reconnectThread_;
    std::thread heartbeatThread_;

    std::atomic<bool> closing_{false};      // aborts an in-flight connectTcp()
};

} // namespace Signaling
} // namespace Tessera
