#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include "Envelope.h"
#include "SocketGuard.h"

namespace Tessera {
namespace Signaling {

enum class SessionState {
    Connecting,     // accepted, waiting for register
    Open,           // in the peer registry
    Closed          // terminal
};

/**
 * @brief One accepted relay connection
 *
 * The session's own thread is the only reader. Writers (the session
 * thread, broadcasts, forwards from other sessions) serialize on
 * writeMutex_ so frames never interleave on the wire.
 */
class RelaySession {
public:
    RelaySession(int fd, std::string remoteAddress);

    RelaySession(const RelaySession&) = delete;
    RelaySession& operator=(const RelaySession&) = delete;

    int fd() const { return socket_.get(); }
    const std::string& remoteAddress() const { return remoteAddress_; }

    const std::string& clientId() const { return clientId_; }
    void setClientId(const std::string& id) { clientId_ = id; }

    SessionState state() const { return state_; }
    void setState(SessionState state) { state_ = state; }

    /// Write one encoded envelope; on failure the session is shut down
    bool send(const std::string& encoded);
    bool send(const Envelope& envelope);

    /// Wake the reader; the descriptor closes with the session
    void shutdown();

private:
    tsr::SocketGuard socket_;
    std::string remoteAddress_;
    std::string clientId_;      // written once by the session thread before Open
    std::atomic<SessionState> state_{SessionState::Connecting};
    std::mutex writeMutex_;
};

} // namespace Signaling
} // namespace Tessera
