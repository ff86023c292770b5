#pragma once

#include <string>

#include "Result.h"

namespace Tessera {
namespace Signaling {

/**
 * @brief host:port of a relay
 *
 * Accepted spellings: "tcp://host:port", "host:port" and "host" (port
 * DEFAULT_RELAY_PORT). A trailing "/" after the port is ignored.
 */
struct Endpoint {
    std::string host;
    int port = 0;

    std::string toString() const { return host + ":" + std::to_string(port); }
    std::string toUrl() const { return "tcp://" + toString(); }

    bool operator==(const Endpoint& other) const { return host == other.host && port == other.port; }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }

    static tsr::Result<Endpoint> parse(const std::string& url);
};

} // namespace Signaling
} // namespace Tessera
