#pragma once

/**
 * @file SocketGuard.h
 * @brief Single owner of a file descriptor
 *
 * Relay sessions, client connections and the listening socket hold their
 * descriptor through this guard. FileStorageBackend uses it for staging
 * files, calling close() so a failed close is still reported.
 */

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>

namespace tsr {

class SocketGuard {
public:
    SocketGuard() noexcept = default;
    explicit SocketGuard(int fd) noexcept : fd_(fd) {}

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : fd_(other.release()) {}

    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    ~SocketGuard() { reset(); }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    /// Caller becomes responsible for closing the returned fd
    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    /// Close the owned fd (errors ignored) and adopt fd
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0 && fd_ != fd) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /**
     * @brief Close now and report the result
     * @return 0, or the errno of the failed close(); the guard is empty afterwards
     */
    int close() noexcept {
        if (fd_ < 0) {
            return 0;
        }
        int rc = ::close(release());
        return rc == 0 ? 0 : errno;
    }

    /// shutdown(SHUT_RDWR): blocked recv()/accept() calls return, the fd stays owned
    void shutdownBoth() const noexcept {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

private:
    int fd_ = -1;
};

} // namespace tsr
