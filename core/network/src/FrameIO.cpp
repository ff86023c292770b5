#include "FrameIO.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sys/socket.h>

namespace Tessera {
namespace Signaling {

namespace {

tsr::Result<void> sendAll(int fd, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return tsr::Err(tsr::ErrorCode::ConnectionTimeout, "send timed out");
            }
            return tsr::Err(tsr::ErrorCode::SendFailed, "send: " + std::string(strerror(errno)));
        }
        sent += static_cast<size_t>(n);
    }
    return tsr::Ok();
}

// 0 bytes read before EOF is an orderly close; EOF mid-frame is an error
tsr::Result<void> recvAll(int fd, char* data, size_t len, bool frameStart) {
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::recv(fd, data + got, len - got, 0);
        if (n == 0) {
            if (frameStart && got == 0) {
                return tsr::Err(tsr::ErrorCode::ConnectionClosed, "peer closed connection");
            }
            return tsr::Err(tsr::ErrorCode::ReceiveFailed, "connection closed mid-frame");
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            return tsr::Err(tsr::ErrorCode::ReceiveFailed, "recv: " + std::string(strerror(errno)));
        }
        got += static_cast<size_t>(n);
    }
    return tsr::Ok();
}

} // namespace

tsr::Result<void> writeFrame(int fd, const std::string& payload) {
    if (payload.size() > UINT32_MAX) {
        return tsr::Err(tsr::ErrorCode::FrameTooLarge, "payload of " + std::to_string(payload.size()) + " bytes");
    }

    // Header and payload in one buffer so a frame is a single send() in the common case
    std::string frame;
    frame.resize(tsr::config::FRAME_HEADER_BYTES + payload.size());
    uint32_t netLen = htonl(static_cast<uint32_t>(payload.size()));
    std::memcpy(&frame[0], &netLen, sizeof(netLen));
    if (!payload.empty()) {
        std::memcpy(&frame[tsr::config::FRAME_HEADER_BYTES], payload.data(), payload.size());
    }
    return sendAll(fd, frame.data(), frame.size());
}

tsr::Result<std::string> readFrame(int fd, size_t maxFrameBytes) {
    uint32_t netLen = 0;
    auto header = recvAll(fd, reinterpret_cast<char*>(&netLen), sizeof(netLen), true);
    if (!header) {
        return header.error();
    }

    uint32_t len = ntohl(netLen);
    if (len > maxFrameBytes) {
        return tsr::Err<std::string>(tsr::ErrorCode::FrameTooLarge,
                                     "frame of " + std::to_string(len) + " bytes exceeds limit of " +
                                     std::to_string(maxFrameBytes));
    }

    std::string payload(len, '\0');
    if (len > 0) {
        auto body = recvAll(fd, &payload[0], len, false);
        if (!body) {
            return body.error();
        }
    }
    return payload;
}

} // namespace Signaling
} // namespace Tessera
