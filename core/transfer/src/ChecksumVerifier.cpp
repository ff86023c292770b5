#include "ChecksumVerifier.h"
#include "SHA256.h"

#include <cctype>

namespace Tessera {
namespace Transfer {

std::string ChecksumVerifier::digest(const std::vector<uint8_t>& data) {
    return SHA256::hashBytes(data);
}

bool ChecksumVerifier::matches(const std::vector<uint8_t>& data, const std::string& expected) {
    std::string actual = digest(data);
    if (actual.empty()) {
        return false;
    }
    return digestsEqual(actual, expected);
}

bool ChecksumVerifier::digestsEqual(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace Transfer
} // namespace Tessera
