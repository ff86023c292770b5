#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "Endpoint.h"
#include "Result.h"
#include "SocketGuard.h"

namespace Tessera {
namespace Signaling {

/**
 * @brief Open a TCP connection to endpoint
 *
 * The connect is non-blocking and polled in short slices so that a
 * concurrent shutdown can abandon it: set *abort to true and the call
 * returns ConnectionClosed. A zero timeout waits indefinitely.
 * The returned socket is back in blocking mode.
 */
tsr::Result<tsr::SocketGuard> connectTcp(const Endpoint& endpoint,
                                         std::chrono::milliseconds timeout,
                                         const std::atomic<bool>* abort = nullptr);

/// Bind and listen; port 0 picks an ephemeral port (see localPort())
tsr::Result<tsr::SocketGuard> listenTcp(const std::string& host, int port, int backlog);

/// Port the socket is bound to, or -1
int localPort(int fd);

/// Address of the connected peer as "ip:port"
std::string peerAddress(int fd);

/// Bound blocking send() calls
void setSendTimeout(int fd, int seconds);

/**
 * @brief Wait until fd is readable
 * @return 1 readable, 0 timeout, -1 error
 */
int waitReadable(int fd, int timeoutMs);

} // namespace Signaling
} // namespace Tessera
