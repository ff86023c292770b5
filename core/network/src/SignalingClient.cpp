#include "SignalingClient.h"
#include "ClientId.h"
#include "FrameIO.h"
#include "TcpSocket.h"

#include <cstddef>
#include <exception>
#include <utility>

namespace Tessera {
namespace Signaling {

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
        default: return "unknown";
    }
}

namespace {

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

SignalingClient::SignalingClient(ClientOptions options)
    : options_(std::move(options))
    , clientId_(ClientId::generate())
{
}

SignalingClient::~SignalingClient() {
    disconnect();
}

tsr::Result<void> SignalingClient::connect() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        manualClose_ = false;
        closing_ = false;
    }
    return attemptConnection(false);
}

tsr::Result<void> SignalingClient::attemptConnection(bool isReconnect) {
    std::lock_guard<std::mutex> attempt(attemptMutex_);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (connection_) {
            return tsr::Ok();
        }
        if (manualClose_) {
            return tsr::Err(tsr::ErrorCode::ConnectionClosed, "client disconnected");
        }
    }

    {
        std::lock_guard<std::recursive_mutex> notify(notifyMutex_);
        state_.set(isReconnect ? ConnectionState::Reconnecting : ConnectionState::Connecting);
    }

    // Resolve the endpoint: discovery first when preferred, the configured URL otherwise
    Endpoint target;
    Backend via = Backend::Relay;
    bool resolved = false;
    if (options_.preferDht && options_.discovery) {
        if (auto found = options_.discovery->findRelay()) {
            target = *found;
            via = Backend::Discovery;
            resolved = true;
        } else {
            logger_.debug("Discovery provider '" + options_.discovery->name() +
                          "' has no relay, using " + options_.url, "SignalingClient");
        }
    }
    if (!resolved) {
        auto parsed = Endpoint::parse(options_.url);
        if (!parsed) {
            logger_.error("Invalid relay URL '" + options_.url + "': " + parsed.error().message, "SignalingClient");
            metrics_.incrementConnectFailures();
            failAttempt(isReconnect);
            return parsed.error();
        }
        target = *parsed;
    }

    auto opened = openConnection(target, via);
    if (!opened && via == Backend::Discovery && !closing_) {
        // A discovered relay that cannot be reached is not a viable path
        auto parsed = Endpoint::parse(options_.url);
        if (parsed) {
            logger_.info("Discovered relay " + target.toString() + " unreachable, falling back to " + options_.url,
                         "SignalingClient");
            target = *parsed;
            via = Backend::Relay;
            opened = openConnection(target, via);
        } else {
            logger_.warn("No fallback relay: " + parsed.error().message, "SignalingClient");
        }
    }
    if (!opened) {
        metrics_.incrementConnectFailures();
        failAttempt(isReconnect);
        return opened.error();
    }
    ConnectionPtr conn = std::move(*opened);

    std::thread previousReader;
    {
        std::lock_guard<std::mutex> sendLock(sendMutex_);
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (manualClose_) {
                return tsr::Err(tsr::ErrorCode::ConnectionClosed, "disconnected while connecting");
            }
            connection_ = conn;
            previousReader = std::move(readThread_);
            readThread_ = std::thread(&SignalingClient::readLoop, this, conn);
            if (options_.heartbeatInterval.count() > 0 && !heartbeatThread_.joinable()) {
                heartbeatThread_ = std::thread(&SignalingClient::heartbeatLoop, this);
            }
        }

        // Queued messages go out before anything sent after this point
        size_t flushed = flushOutbox(conn);
        if (flushed > 0) {
            logger_.info("Delivered " + std::to_string(flushed) + " queued messages", "SignalingClient");
        }
    }
    joinThread(previousReader);

    {
        std::lock_guard<std::recursive_mutex> notify(notifyMutex_);
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (connection_ != conn) {
                // Already lost again; onConnectionLost() published that
                return tsr::Ok();
            }
        }
        backend_.set(via);
        state_.set(ConnectionState::Connected);
        connected_.set(true);
    }

    logger_.info("Connected to relay " + target.toString() + " as " + clientId_, "SignalingClient");
    return tsr::Ok();
}

tsr::Result<SignalingClient::ConnectionPtr> SignalingClient::openConnection(const Endpoint& target, Backend via) {
    logger_.info("Connecting to relay " + target.toString() +
                 (via == Backend::Discovery ? " (discovery)" : ""), "SignalingClient");

    auto socket = connectTcp(target, options_.connectTimeout, &closing_);
    if (!socket) {
        logger_.warn("Connection to " + target.toString() + " failed: " + socket.error().message, "SignalingClient");
        return socket.error();
    }

    auto conn = std::make_shared<Connection>(std::move(*socket));

    // Nobody else can see conn yet, so register is guaranteed to be the first frame
    auto registered = writeFrame(conn->socket.get(), encodeEnvelope(Envelope::makeRegister(clientId_)));
    if (!registered) {
        logger_.warn("Register with " + target.toString() + " failed: " + registered.error().message, "SignalingClient");
        return registered.error();
    }
    return conn;
}

void SignalingClient::failAttempt(bool isReconnect) {
    std::lock_guard<std::recursive_mutex> notify(notifyMutex_);
    bool stopped;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        stopped = manualClose_;
    }
    connected_.set(false);
    state_.set(isReconnect && !stopped ? ConnectionState::Reconnecting : ConnectionState::Disconnected);
}

size_t SignalingClient::flushOutbox(const ConnectionPtr& conn) {
    auto pending = outbox_.drain();
    size_t written = 0;
    for (; written < pending.size(); ++written) {
        const auto& message = pending[written];
        if (!writeTo(conn, Envelope::makeMessage(message.to, clientId_, message.payload))) {
            break;
        }
    }

    if (written < pending.size()) {
        logger_.warn("Outbox flush interrupted, " + std::to_string(pending.size() - written) +
                     " messages requeued", "SignalingClient");
        pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(written));
        outbox_.requeueFront(std::move(pending));
    }

    if (written > 0) {
        metrics_.addOutboxFlushed(written);
    }
    return written;
}

bool SignalingClient::writeTo(const ConnectionPtr& conn, const Envelope& envelope) {
    if (!conn || !conn->open) {
        return false;
    }

    auto written = writeFrame(conn->socket.get(), encodeEnvelope(envelope));
    if (!written) {
        logger_.warn("Write to relay failed: " + written.error().message, "SignalingClient");
        // The reader sees the shutdown and runs the connection-lost path
        conn->open = false;
        conn->socket.shutdownBoth();
        return false;
    }
    return true;
}

SignalingClient::ConnectionPtr SignalingClient::currentConnection() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return connection_;
}

void SignalingClient::send(const std::string& to, const Json::Value& payload) {
    std::lock_guard<std::mutex> sendLock(sendMutex_);
    auto conn = currentConnection();
    if (conn && writeTo(conn, Envelope::makeMessage(to, clientId_, payload))) {
        return;
    }

    outbox_.enqueue(OutboxMessage(to, payload));
    metrics_.incrementOutboxEnqueued();
    if (logger_.isDebugEnabled()) {
        logger_.debug("Queued message for " + to + " (" + std::to_string(outbox_.size()) + " pending)",
                      "SignalingClient");
    }
}

void SignalingClient::setOnMessage(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    onMessage_ = std::move(handler);
}

void SignalingClient::disconnect() {
    ConnectionPtr conn;
    std::thread reader;
    std::thread reconnect;
    std::thread heartbeat;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        manualClose_ = true;
        closing_ = true;
        conn = std::move(connection_);
        reader = std::move(readThread_);
        reconnect = std::move(reconnectThread_);
        heartbeat = std::move(heartbeatThread_);
    }
    stateCv_.notify_all();

    if (conn) {
        logger_.info("Disconnecting from relay", "SignalingClient");
        conn->open = false;
        conn->socket.shutdownBoth();
    }

    joinThread(reconnect);
    joinThread(reader);
    joinThread(heartbeat);

    std::lock_guard<std::recursive_mutex> notify(notifyMutex_);
    connected_.set(false);
    peers_.set({});
    state_.set(ConnectionState::Disconnected);
    backend_.set(Backend::None);
}

void SignalingClient::readLoop(ConnectionPtr conn) {
    while (true) {
        auto frame = readFrame(conn->socket.get(), options_.maxFrameBytes);
        if (!frame) {
            const auto& err = frame.error();
            if (err.code == tsr::ErrorCode::FrameTooLarge) {
                metrics_.incrementProtocolErrors();
                logger_.warn("Relay sent an oversized frame: " + err.message, "SignalingClient");
            } else if (err.code != tsr::ErrorCode::ConnectionClosed && conn->open) {
                logger_.warn("Read from relay failed: " + err.message, "SignalingClient");
            }
            break;
        }

        auto envelope = decodeEnvelope(*frame);
        if (!envelope) {
            metrics_.incrementProtocolErrors();
            logger_.warn("Malformed envelope from relay: " + envelope.error().message, "SignalingClient");
            continue;
        }
        dispatch(conn, *envelope);
    }

    conn->open = false;
    onConnectionLost(conn);
}

void SignalingClient::dispatch(const ConnectionPtr& conn, const Envelope& envelope) {
    switch (envelope.type) {
        case EnvelopeType::Peers: {
            std::lock_guard<std::recursive_mutex> notify(notifyMutex_);
            if (currentConnection() == conn) {
                peers_.set(envelope.peers);
            }
            break;
        }

        case EnvelopeType::Registered:
            if (envelope.clientId != clientId_) {
                logger_.warn("Relay registered us as " + envelope.clientId + ", keeping " + clientId_,
                             "SignalingClient");
            }
            break;

        case EnvelopeType::Ping: {
            std::lock_guard<std::mutex> sendLock(sendMutex_);
            writeTo(conn, Envelope::makePong(envelope.ts));
            break;
        }

        case EnvelopeType::Pong:
            if (logger_.isDebugEnabled()) {
                logger_.debug("Relay RTT " + std::to_string(nowMillis() - envelope.ts) + "ms", "SignalingClient");
            }
            break;

        case EnvelopeType::Message:
            deliver(envelope.from, envelope.message);
            break;

        default:
            deliver(envelope.from, envelope.raw);
            break;
    }
}

void SignalingClient::deliver(const std::string& from, const Json::Value& payload) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        handler = onMessage_;
    }
    if (!handler) {
        logger_.debug("No message handler installed, dropping payload from " + from, "SignalingClient");
        return;
    }

    try {
        handler(from, payload);
    } catch (const std::exception& e) {
        logger_.error("Message handler threw: " + std::string(e.what()), "SignalingClient");
    }
}

void SignalingClient::onConnectionLost(const ConnectionPtr& conn) {
    std::thread previousReconnect;
    {
        std::lock_guard<std::recursive_mutex> notify(notifyMutex_);
        bool reconnecting;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (connection_ != conn) {
                // disconnect() or a newer connection already took over
                return;
            }
            connection_.reset();
            if (!manualClose_ && options_.autoReconnect && !reconnecting_) {
                reconnecting_ = true;
                previousReconnect = std::move(reconnectThread_);
                reconnectThread_ = std::thread(&SignalingClient::reconnectLoop, this);
            }
            reconnecting = reconnecting_;
        }

        logger_.warn("Connection to relay lost" + std::string(reconnecting ? ", reconnecting" : ""),
                     "SignalingClient");
        connected_.set(false);
        peers_.set({});
        state_.set(reconnecting ? ConnectionState::Reconnecting : ConnectionState::Disconnected);
        backend_.set(Backend::None);
    }
    joinThread(previousReconnect);
}

void SignalingClient::reconnectLoop() {
    int attempt = 0;
    std::unique_lock<std::mutex> lock(stateMutex_);
    while (!manualClose_ && !connection_) {
        ++attempt;
        auto delay = options_.reconnect.nextDelay(attempt);
        if (stateCv_.wait_for(lock, delay, [this] { return manualClose_ || connection_ != nullptr; })) {
            break;
        }

        lock.unlock();
        metrics_.incrementReconnectAttempts();
        logger_.info("Reconnect attempt " + std::to_string(attempt) + " after " +
                     std::to_string(delay.count()) + "ms", "SignalingClient");
        auto result = attemptConnection(true);
        if (!result) {
            logger_.debug("Reconnect attempt " + std::to_string(attempt) + " failed: " + result.error().message,
                          "SignalingClient");
        }
        lock.lock();
    }
    reconnecting_ = false;
}

void SignalingClient::heartbeatLoop() {
    std::unique_lock<std::mutex> lock(stateMutex_);
    while (!manualClose_) {
        if (stateCv_.wait_for(lock, options_.heartbeatInterval, [this] { return manualClose_; })) {
            break;
        }
        lock.unlock();
        {
            std::lock_guard<std::mutex> sendLock(sendMutex_);
            auto conn = currentConnection();
            if (conn) {
                writeTo(conn, Envelope::makePing(nowMillis()));
            }
        }
        lock.lock();
    }
}

void SignalingClient::joinThread(std::thread& thread) {
    if (!thread.joinable()) {
        return;
    }
    if (thread.get_id() == std::this_thread::get_id()) {
        thread.detach();
    } else {
        thread.join();
    }
}

} // namespace Signaling
} // namespace Tessera
