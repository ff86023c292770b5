#include "ReconnectPolicy.h"

#include <algorithm>
#include <random>

namespace Tessera {
namespace Signaling {

std::chrono::milliseconds ReconnectPolicy::backoff(int attempt) const {
    if (attempt < 1) attempt = 1;

    long long delay = baseDelay.count();
    long long cap = maxDelay.count();
    // Doubling stops as soon as the cap is reached, so no overflow
    for (int i = 1; i < attempt && delay < cap; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, cap));
}

std::chrono::milliseconds ReconnectPolicy::nextDelay(int attempt) const {
    auto delay = backoff(attempt);
    if (jitter.count() > 0) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<long long> dis(0, jitter.count());
        delay += std::chrono::milliseconds(dis(gen));
    }
    return std::min(delay, maxDelay);
}

} // namespace Signaling
} // namespace Tessera
