#pragma once

/**
 * @file OutboxQueue.h
 * @brief Messages submitted while no relay connection is open
 */

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <json/json.h>

namespace Tessera {
namespace Signaling {

/**
 * @brief A directed message waiting for a connection
 */
struct OutboxMessage {
    std::string to;
    Json::Value payload;
    std::chrono::steady_clock::time_point queuedAt;

    OutboxMessage(std::string target, Json::Value body)
        : to(std::move(target)), payload(std::move(body)),
          queuedAt(std::chrono::steady_clock::now()) {}
};

/**
 * @brief FIFO of outgoing messages
 *
 * The client drains it when a connection opens; anything it fails to
 * write goes back to the front with requeueFront() so the original
 * submission order survives.
 *
 * @code
 * auto pending = outbox.drain();
 * size_t sent = writeAll(pending);
 * outbox.requeueFront({pending.begin() + sent, pending.end()});
 * @endcode
 */
class OutboxQueue {
public:
    OutboxQueue() = default;

    // Non-copyable
    OutboxQueue(const OutboxQueue&) = delete;
    OutboxQueue& operator=(const OutboxQueue&) = delete;

    void enqueue(OutboxMessage message);

    /// Remove and return everything, oldest first
    std::vector<OutboxMessage> drain();

    /// Put messages back ahead of anything queued meanwhile, keeping their order
    void requeueFront(std::vector<OutboxMessage> messages);

    std::size_t size() const;
    bool empty() const;
    void clear();

    /// Copy of the pending messages, oldest first
    std::vector<OutboxMessage> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::deque<OutboxMessage> queue_;
};

} // namespace Signaling
} // namespace Tessera
