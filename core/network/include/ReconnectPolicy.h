#pragma once

#include <chrono>

#include "Constants.h"

namespace Tessera {
namespace Signaling {

/**
 * @brief Exponential backoff with jitter for relay reconnection
 *
 * delay(n) = min(base * 2^(n-1), max) + uniform[0, jitter], clamped to max.
 * Attempts are numbered from 1.
 */
struct ReconnectPolicy {
    std::chrono::milliseconds baseDelay{tsr::config::RECONNECT_BASE_DELAY_MS};
    std::chrono::milliseconds maxDelay{tsr::config::RECONNECT_MAX_DELAY_MS};
    std::chrono::milliseconds jitter{tsr::config::RECONNECT_JITTER_MS};

    /// Deterministic part of the delay
    std::chrono::milliseconds backoff(int attempt) const;

    /// backoff() plus random jitter
    std::chrono::milliseconds nextDelay(int attempt) const;
};

} // namespace Signaling
} // namespace Tessera
