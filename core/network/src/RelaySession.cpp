#include "RelaySession.h"
#include "FrameIO.h"
#include "Logger.h"

#include <utility>

namespace Tessera {
namespace Signaling {

RelaySession::RelaySession(int fd, std::string remoteAddress)
    : socket_(fd), remoteAddress_(std::move(remoteAddress)) {
}

bool RelaySession::send(const std::string& encoded) {
    if (state_ == SessionState::Closed) {
        return false;
    }

    tsr::Result<void> written;
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        written = writeFrame(socket_.get(), encoded);
    }
    if (!written) {
        Logger::instance().warn("Write to " + (clientId_.empty() ? remoteAddress_ : clientId_) +
                                " failed: " + written.error().message, "SignalingServer");
        shutdown();
        return false;
    }
    return true;
}

bool RelaySession::send(const Envelope& envelope) {
    return send(encodeEnvelope(envelope));
}

void RelaySession::shutdown() {
    socket_.shutdownBoth();
}

} // namespace Signaling
} // namespace Tessera
