#include "TcpSocket.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace Tessera {
namespace Signaling {

namespace {

constexpr int CONNECT_POLL_SLICE_MS = 100;

tsr::Result<sockaddr_in> resolve(const std::string& host, int port) {
    struct addrinfo hints{};
    struct addrinfo* result = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    std::string portStr = std::to_string(port);
    int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result);
    if (status != 0 || !result) {
        return tsr::Err<sockaddr_in>(tsr::ErrorCode::AddressResolutionFailed,
                                     "cannot resolve " + host + ": " + gai_strerror(status));
    }

    sockaddr_in addr{};
    std::memcpy(&addr, result->ai_addr, sizeof(addr));
    freeaddrinfo(result);
    return addr;
}

} // namespace

tsr::Result<tsr::SocketGuard> connectTcp(const Endpoint& endpoint,
                                         std::chrono::milliseconds timeout,
                                         const std::atomic<bool>* abort) {
    using tsr::ErrorCode;

    auto addr = resolve(endpoint.host, endpoint.port);
    if (!addr) {
        return addr.error();
    }

    tsr::SocketGuard sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock) {
        return tsr::Err<tsr::SocketGuard>(ErrorCode::ConnectionFailed,
                                          "socket: " + std::string(strerror(errno)));
    }

    // Set non-blocking for connect with timeout
    int flags = fcntl(sock.get(), F_GETFL, 0);
    fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(sock.get(), reinterpret_cast<const sockaddr*>(&*addr), sizeof(sockaddr_in));
    if (rc < 0 && errno != EINPROGRESS) {
        return tsr::Err<tsr::SocketGuard>(ErrorCode::ConnectionFailed,
                                          endpoint.toString() + ": " + strerror(errno));
    }

    if (rc < 0) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (abort && abort->load()) {
                return tsr::Err<tsr::SocketGuard>(ErrorCode::ConnectionClosed, "connect abandoned");
            }

            int slice = CONNECT_POLL_SLICE_MS;
            if (timeout.count() > 0) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now()).count();
                if (left <= 0) {
                    return tsr::Err<tsr::SocketGuard>(ErrorCode::ConnectionTimeout,
                                                      endpoint.toString() + ": timed out after " +
                                                      std::to_string(timeout.count()) + "ms");
                }
                if (left < slice) slice = static_cast<int>(left);
            }

            struct pollfd pfd{};
            pfd.fd = sock.get();
            pfd.events = POLLOUT;
            int ready = poll(&pfd, 1, slice);
            if (ready > 0) break;
            if (ready < 0 && errno != EINTR) {
                return tsr::Err<tsr::SocketGuard>(ErrorCode::ConnectionFailed,
                                                  "poll: " + std::string(strerror(errno)));
            }
        }

        // Check for connection error
        int error = 0;
        socklen_t len = sizeof(error);
        getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &error, &len);
        if (error != 0) {
            return tsr::Err<tsr::SocketGuard>(ErrorCode::ConnectionFailed,
                                              endpoint.toString() + ": " + strerror(error));
        }
    }

    // Set back to blocking
    fcntl(sock.get(), F_SETFL, flags);

    int one = 1;
    setsockopt(sock.get(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    return tsr::Result<tsr::SocketGuard>(std::move(sock));
}

tsr::Result<tsr::SocketGuard> listenTcp(const std::string& host, int port, int backlog) {
    using tsr::ErrorCode;

    tsr::SocketGuard sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock) {
        return tsr::Err<tsr::SocketGuard>(ErrorCode::NetworkError, "socket: " + std::string(strerror(errno)));
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return tsr::Err<tsr::SocketGuard>(ErrorCode::NetworkError, "setsockopt: " + std::string(strerror(errno)));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (host.empty() || host == "0.0.0.0" || host == "*") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        auto resolved = resolve(host, port);
        if (!resolved) {
            return resolved.error();
        }
        addr = *resolved;
    }

    if (bind(sock.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        return tsr::Err<tsr::SocketGuard>(ErrorCode::NetworkError,
                                          "bind " + host + ":" + std::to_string(port) + ": " + strerror(errno));
    }

    if (listen(sock.get(), backlog) < 0) {
        return tsr::Err<tsr::SocketGuard>(ErrorCode::NetworkError, "listen: " + std::string(strerror(errno)));
    }

    return tsr::Result<tsr::SocketGuard>(std::move(sock));
}

int localPort(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return -1;
    }
    return ntohs(addr.sin_port);
}

std::string peerAddress(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return "unknown";
    }
    char ipBuf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ipBuf, INET_ADDRSTRLEN);
    return std::string(ipBuf) + ":" + std::to_string(ntohs(addr.sin_port));
}

void setSendTimeout(int fd, int seconds) {
    struct timeval tv;
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

int waitReadable(int fd, int timeoutMs) {
    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    while (true) {
        int ready = poll(&pfd, 1, timeoutMs);
        if (ready < 0 && errno == EINTR) continue;
        if (ready < 0) return -1;
        return ready > 0 ? 1 : 0;
    }
}

} // namespace Signaling
} // namespace Tessera
