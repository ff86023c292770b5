#pragma once

#include <atomic>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "Constants.h"
#include "Envelope.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PeerRegistry.h"
#include "RelaySession.h"
#include "Result.h"
#include "SocketGuard.h"

namespace Tessera {
namespace Signaling {

struct ServerOptions {
    std::string host = "0.0.0.0";
    int port = tsr::config::DEFAULT_RELAY_PORT;     // 0 = ephemeral
    int handshakeTimeoutMs = tsr::config::HANDSHAKE_TIMEOUT_MS;
    size_t maxFrameBytes = tsr::config::MAX_FRAME_BYTES;
};

/**
 * @brief Signaling relay
 *
 * Manages:
 * - The listening socket and accept loop
 * - One thread per accepted connection (Connecting -> Open -> Closed)
 * - The peer registry and "peers" broadcasts on every membership change
 * - Forwarding of directed "message" envelopes
 */
class SignalingServer {
public:
    explicit SignalingServer(ServerOptions options = ServerOptions());
    ~SignalingServer();

    SignalingServer(const SignalingServer&) = delete;
    SignalingServer& operator=(const SignalingServer&) = delete;

    /**
     * @brief Bind, listen and start accepting
     * @return Error if the socket cannot be bound or the server is already running
     */
    tsr::Result<void> start();

    /**
     * @brief Stop accepting, close every connection and join all threads
     */
    void stop();

    bool isRunning() const { return running_; }

    /**
     * @brief Port actually bound (useful with port 0)
     * @return The listening port, or 0 if not listening
     */
    int getListeningPort() const { return listeningPort_; }

    /// Registered client ids, in registration order
    std::vector<std::string> getPeerIds() const;

    /// Accepted connections that have not closed yet, registered or not
    size_t connectionCount() const { return activeConnections_; }

private:
    struct Worker {
        std::shared_ptr<RelaySession> session;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    void acceptLoop();
    void reapWorkers();
    void serveSession(std::shared_ptr<RelaySession> session, std::shared_ptr<std::atomic<bool>> done);

    /// Handshake; returns false if the connection closed before it could open
    bool awaitRegistration(const std::shared_ptr<RelaySession>& session,
                           std::string& clientId, std::unique_ptr<Envelope>& firstFrame);
    void openSession(const std::shared_ptr<RelaySession>& session, const std::string& clientId);
    void closeSession(const std::shared_ptr<RelaySession>& session, bool wasOpen);
    void handleEnvelope(const std::shared_ptr<RelaySession>& session, const Envelope& envelope);
    void forwardMessage(const std::shared_ptr<RelaySession>& sender, const Envelope& envelope);

    /// Send the current peer list to every open session; caller holds membershipMutex_
    void broadcastPeers();

    std::string assignClientId();

    ServerOptions options_;

    Logger& logger_{Logger::instance()};
    MetricsCollector& metrics_{MetricsCollector::instance()};

    tsr::SocketGuard listener_;
    std::atomic<int> listeningPort_{0};
    std::atomic<bool> running_{false};
    std::thread acceptThread_;

    PeerRegistry registry_;
    std::mutex membershipMutex_;    // one registry change + its broadcast at a time

    std::mutex workersMutex_;
    std::list<Worker> workers_;
    std::atomic<size_t> activeConnections_{0};
};

} // namespace Signaling
} // namespace Tessera
