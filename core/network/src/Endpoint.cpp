#include "Endpoint.h"
#include "Constants.h"

#include <cctype>

namespace Tessera {
namespace Signaling {

tsr::Result<Endpoint> Endpoint::parse(const std::string& url) {
    using tsr::ErrorCode;

    std::string rest = url;
    auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        std::string name = rest.substr(0, scheme);
        if (name != "tcp") {
            return tsr::Err<Endpoint>(ErrorCode::InvalidArgument, "unsupported scheme '" + name + "' in " + url);
        }
        rest = rest.substr(scheme + 3);
    }
    while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }
    if (rest.empty()) {
        return tsr::Err<Endpoint>(ErrorCode::InvalidArgument, "empty relay address");
    }

    Endpoint endpoint;
    auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        endpoint.host = rest;
        endpoint.port = tsr::config::DEFAULT_RELAY_PORT;
        return endpoint;
    }

    endpoint.host = rest.substr(0, colon);
    std::string portText = rest.substr(colon + 1);
    if (endpoint.host.empty()) {
        return tsr::Err<Endpoint>(ErrorCode::InvalidArgument, "missing host in " + url);
    }
    if (portText.empty() || portText.size() > 5) {
        return tsr::Err<Endpoint>(ErrorCode::InvalidArgument, "invalid port in " + url);
    }
    for (char c : portText) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return tsr::Err<Endpoint>(ErrorCode::InvalidArgument, "invalid port in " + url);
        }
    }
    endpoint.port = std::stoi(portText);
    if (endpoint.port < 1 || endpoint.port > 65535) {
        return tsr::Err<Endpoint>(ErrorCode::InvalidArgument, "port out of range in " + url);
    }
    return endpoint;
}

} // namespace Signaling
} // namespace Tessera
