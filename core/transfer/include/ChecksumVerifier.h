#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Tessera {
namespace Transfer {

/**
 * @brief Digest computation and comparison for chunk payloads
 *
 * Digests are lowercase hex SHA-256. Comparison ignores case so that
 * manifests produced by tools emitting uppercase hex still verify.
 */
class ChecksumVerifier {
public:
    static std::string digest(const std::vector<uint8_t>& data);

    /// True if the digest of data equals expected (case-insensitive)
    static bool matches(const std::vector<uint8_t>& data, const std::string& expected);

    static bool digestsEqual(const std::string& a, const std::string& b);
};

} // namespace Transfer
} // namespace Tessera
