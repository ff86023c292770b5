#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Endpoint.h"
#include "Result.h"

namespace Tessera {
namespace Signaling {

/**
 * @brief Source of relay endpoints other than the configured URL
 *
 * SignalingClient consults it first when preferDht is set. The protocol
 * behind it (a DHT lookup, a bootstrap list, ...) is opaque to the client.
 */
class IDiscoveryProvider {
public:
    virtual ~IDiscoveryProvider() = default;

    /// A relay worth trying now, or nullopt if none is known
    virtual std::optional<Endpoint> findRelay() = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Fixed list of relays served round-robin
 */
class StaticDiscoveryProvider : public IDiscoveryProvider {
public:
    explicit StaticDiscoveryProvider(std::vector<Endpoint> relays);

    /// Parse every entry; fails on the first malformed one
    static tsr::Result<std::vector<Endpoint>> parseList(const std::vector<std::string>& urls);

    std::optional<Endpoint> findRelay() override;
    std::string name() const override { return "static"; }

    size_t size() const { return relays_.size(); }

private:
    std::vector<Endpoint> relays_;
    size_t next_ = 0;
    std::mutex mutex_;
};

} // namespace Signaling
} // namespace Tessera
