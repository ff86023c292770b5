#include "DiscoveryProvider.h"

#include <utility>

namespace Tessera {
namespace Signaling {

StaticDiscoveryProvider::StaticDiscoveryProvider(std::vector<Endpoint> relays)
    : relays_(std::move(relays)) {
}

tsr::Result<std::vector<Endpoint>> StaticDiscoveryProvider::parseList(const std::vector<std::string>& urls) {
    std::vector<Endpoint> endpoints;
    for (const auto& url : urls) {
        auto endpoint = Endpoint::parse(url);
        if (!endpoint) {
            return endpoint.error();
        }
        endpoints.push_back(*endpoint);
    }
    return endpoints;
}

std::optional<Endpoint> StaticDiscoveryProvider::findRelay() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (relays_.empty()) {
        return std::nullopt;
    }
    Endpoint endpoint = relays_[next_ % relays_.size()];
    next_ = (next_ + 1) % relays_.size();
    return endpoint;
}

} // namespace Signaling
} // namespace Tessera
