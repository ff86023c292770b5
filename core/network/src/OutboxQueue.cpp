#include "OutboxQueue.h"
#include "Logger.h"

namespace Tessera {
namespace Signaling {

void OutboxQueue::enqueue(OutboxMessage message) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(message));

    auto& logger = Logger::instance();
    if (logger.isDebugEnabled()) {
        logger.debug("Queued message for " + queue_.back().to + " (" +
                     std::to_string(queue_.size()) + " pending)", "OutboxQueue");
    }
}

std::vector<OutboxMessage> OutboxQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OutboxMessage> messages;
    messages.reserve(queue_.size());
    while (!queue_.empty()) {
        messages.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    return messages;
}

void OutboxQueue::requeueFront(std::vector<OutboxMessage> messages) {
    if (messages.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
        queue_.push_front(std::move(*it));
    }
}

std::size_t OutboxQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool OutboxQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

void OutboxQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = queue_.size();
    queue_.clear();

    if (dropped > 0) {
        Logger::instance().info("Outbox cleared, " + std::to_string(dropped) + " messages dropped", "OutboxQueue");
    }
}

std::vector<OutboxMessage> OutboxQueue::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<OutboxMessage>(queue_.begin(), queue_.end());
}

} // namespace Signaling
} // namespace Tessera
