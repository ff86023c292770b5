#include "SignalingServer.h"
#include "ClientId.h"
#include "FrameIO.h"
#include "TcpSocket.h"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

namespace Tessera {
namespace Signaling {

SignalingServer::SignalingServer(ServerOptions options)
    : options_(std::move(options)) {
}

SignalingServer::~SignalingServer() {
    stop();
}

tsr::Result<void> SignalingServer::start() {
    if (running_) {
        return tsr::Err(tsr::ErrorCode::InvalidArgument, "relay already running");
    }

    logger_.info("Starting relay on " + options_.host + ":" + std::to_string(options_.port), "SignalingServer");

    auto listener = listenTcp(options_.host, options_.port, tsr::config::RELAY_BACKLOG);
    if (!listener) {
        logger_.error("Failed to start relay: " + listener.error().message, "SignalingServer");
        return listener.error();
    }

    listener_ = std::move(*listener);
    listeningPort_ = localPort(listener_.get());
    running_ = true;
    acceptThread_ = std::thread(&SignalingServer::acceptLoop, this);

    logger_.info("Relay listening on port " + std::to_string(listeningPort_.load()), "SignalingServer");
    return tsr::Ok();
}

void SignalingServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    logger_.info("Stopping relay", "SignalingServer");

    // Wakes the accept poll; accept() then fails and the loop sees running_ == false
    listener_.shutdownBoth();
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    listener_.reset();
    listeningPort_ = 0;

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers.swap(workers_);
    }

    // Close all connections to unblock session threads
    for (auto& worker : workers) {
        worker.session->shutdown();
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    logger_.info("Relay stopped, closed " + std::to_string(workers.size()) + " connections", "SignalingServer");
}

std::vector<std::string> SignalingServer::getPeerIds() const {
    return registry_.ids();
}

void SignalingServer::acceptLoop() {
    while (running_) {
        reapWorkers();

        int ready = waitReadable(listener_.get(), tsr::config::ACCEPT_POLL_INTERVAL_MS);
        if (ready == 0) continue;
        if (ready < 0) {
            logger_.error("Accept poll failed: " + std::string(strerror(errno)), "SignalingServer");
            break;
        }

        struct sockaddr_in clientAddr{};
        socklen_t len = sizeof(clientAddr);
        int clientSocket = ::accept4(listener_.get(), reinterpret_cast<sockaddr*>(&clientAddr), &len, SOCK_CLOEXEC);
        if (clientSocket < 0) {
            if (!running_) break;
            if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
            logger_.warn("accept failed: " + std::string(strerror(errno)), "SignalingServer");
            std::this_thread::sleep_for(std::chrono::milliseconds(tsr::config::ACCEPT_POLL_INTERVAL_MS));
            continue;
        }

        setSendTimeout(clientSocket, tsr::config::SOCKET_SEND_TIMEOUT_SEC);
        int one = 1;
        setsockopt(clientSocket, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        auto session = std::make_shared<RelaySession>(clientSocket, peerAddress(clientSocket));
        auto done = std::make_shared<std::atomic<bool>>(false);
        logger_.debug("New connection from " + session->remoteAddress(), "SignalingServer");
        activeConnections_++;

        std::lock_guard<std::mutex> lock(workersMutex_);
        workers_.push_back(Worker{session, done, std::thread(&SignalingServer::serveSession, this, session, done)});
    }
}

void SignalingServer::reapWorkers() {
    std::lock_guard<std::mutex> lock(workersMutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void SignalingServer::serveSession(std::shared_ptr<RelaySession> session, std::shared_ptr<std::atomic<bool>> done) {
    std::string clientId;
    std::unique_ptr<Envelope> firstFrame;
    bool opened = false;

    if (awaitRegistration(session, clientId, firstFrame)) {
        openSession(session, clientId);
        opened = true;

        if (firstFrame) {
            handleEnvelope(session, *firstFrame);
        }

        while (running_) {
            auto frame = readFrame(session->fd(), options_.maxFrameBytes);
            if (!frame) {
                const auto& err = frame.error();
                if (err.code == tsr::ErrorCode::FrameTooLarge) {
                    metrics_.incrementProtocolErrors();
                    logger_.warn("Closing " + clientId + ": " + err.message, "SignalingServer");
                } else if (err.code != tsr::ErrorCode::ConnectionClosed) {
                    logger_.debug("Read from " + clientId + " failed: " + err.message, "SignalingServer");
                }
                break;
            }

            auto envelope = decodeEnvelope(*frame);
            if (!envelope) {
                metrics_.incrementProtocolErrors();
                logger_.warn("Malformed envelope from " + clientId + ": " + envelope.error().message, "SignalingServer");
                continue;
            }
            handleEnvelope(session, *envelope);
        }
    }

    closeSession(session, opened);
    activeConnections_--;
    done->store(true);
}

bool SignalingServer::awaitRegistration(const std::shared_ptr<RelaySession>& session,
                                        std::string& clientId, std::unique_ptr<Envelope>& firstFrame) {
    int ready = waitReadable(session->fd(), options_.handshakeTimeoutMs);
    if (ready < 0) {
        return false;
    }

    if (ready == 0) {
        clientId = assignClientId();
        logger_.debug("No register from " + session->remoteAddress() + " within " +
                      std::to_string(options_.handshakeTimeoutMs) + "ms, assigned " + clientId, "SignalingServer");
        return running_;
    }

    auto frame = readFrame(session->fd(), options_.maxFrameBytes);
    if (!frame) {
        if (frame.error().code == tsr::ErrorCode::FrameTooLarge) {
            metrics_.incrementProtocolErrors();
            logger_.warn("Oversized first frame from " + session->remoteAddress(), "SignalingServer");
        }
        return false;
    }

    auto envelope = decodeEnvelope(*frame);
    if (!envelope) {
        metrics_.incrementProtocolErrors();
        logger_.warn("Malformed handshake from " + session->remoteAddress() + ": " + envelope.error().message,
                     "SignalingServer");
        return false;
    }

    if (envelope->type == EnvelopeType::Register && !envelope->clientId.empty()) {
        clientId = envelope->clientId;
    } else {
        clientId = assignClientId();
        if (envelope->type != EnvelopeType::Register) {
            firstFrame = std::make_unique<Envelope>(std::move(*envelope));
        }
    }
    return running_;
}

void SignalingServer::openSession(const std::shared_ptr<RelaySession>& session, const std::string& clientId) {
    session->setClientId(clientId);
    session->setState(SessionState::Open);
    session->send(Envelope::makeRegistered(clientId));

    std::lock_guard<std::mutex> lock(membershipMutex_);
    auto previous = registry_.insert(clientId, session);
    if (previous) {
        logger_.warn("Client " + clientId + " reconnected from " + session->remoteAddress() +
                     ", closing stale connection from " + previous->remoteAddress(), "SignalingServer");
        previous->shutdown();
    }

    metrics_.incrementConnectionsOpened();
    logger_.info("Client registered: " + clientId + " (" + session->remoteAddress() + "), " +
                 std::to_string(registry_.size()) + " online", "SignalingServer");
    broadcastPeers();
}

void SignalingServer::closeSession(const std::shared_ptr<RelaySession>& session, bool wasOpen) {
    session->setState(SessionState::Closed);
    session->shutdown();
    if (!wasOpen) {
        logger_.debug("Connection from " + session->remoteAddress() + " closed before registering", "SignalingServer");
        return;
    }

    metrics_.incrementConnectionsClosed();

    std::lock_guard<std::mutex> lock(membershipMutex_);
    if (!registry_.remove(session->clientId(), session)) {
        // Superseded by a newer connection under the same id
        return;
    }
    logger_.info("Client disconnected: " + session->clientId() + ", " +
                 std::to_string(registry_.size()) + " online", "SignalingServer");
    if (running_) {
        broadcastPeers();
    }
}

void SignalingServer::handleEnvelope(const std::shared_ptr<RelaySession>& session, const Envelope& envelope) {
    switch (envelope.type) {
        case EnvelopeType::Message:
            forwardMessage(session, envelope);
            break;

        case EnvelopeType::Ping:
            session->send(Envelope::makePong(envelope.ts));
            break;

        case EnvelopeType::Pong:
            break;

        case EnvelopeType::Register:
            logger_.debug(session->clientId() + " sent register on an open connection, ignored", "SignalingServer");
            break;

        default:
            logger_.debug("Ignoring '" + envelope.typeName + "' envelope from " + session->clientId(), "SignalingServer");
            break;
    }
}

void SignalingServer::forwardMessage(const std::shared_ptr<RelaySession>& sender, const Envelope& envelope) {
    auto target = registry_.find(envelope.to);
    if (!target) {
        metrics_.incrementMessagesDropped();
        logger_.debug("Dropping message from " + sender->clientId() + ": " + envelope.to + " is not connected",
                      "SignalingServer");
        return;
    }

    if (target->send(Envelope::makeMessage(envelope.to, sender->clientId(), envelope.message))) {
        metrics_.incrementMessagesForwarded();
    } else {
        metrics_.incrementMessagesDropped();
    }
}

void SignalingServer::broadcastPeers() {
    auto sessions = registry_.sessions();
    std::vector<std::string> ids;
    ids.reserve(sessions.size());
    for (const auto& session : sessions) {
        ids.push_back(session->clientId());
    }

    std::string encoded = encodeEnvelope(Envelope::makePeers(ids));
    for (const auto& session : sessions) {
        session->send(encoded);
    }
    metrics_.incrementPeerBroadcasts();
}

std::string SignalingServer::assignClientId() {
    std::string id;
    do {
        id = ClientId::generate();
    } while (registry_.contains(id));
    return id;
}

} // namespace Signaling
} // namespace Tessera
