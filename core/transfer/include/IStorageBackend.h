#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Result.h"

namespace Tessera {
namespace Transfer {

struct FinalizeRequest {
    std::string transferId;
    std::string stagingPath;        // where chunks were written
    std::string destinationPath;    // where the completed file must end up
    std::optional<std::string> expectedDigest;  // hex SHA-256 of the whole staged file
};

struct FinalizeResult {
    bool ok{false};
    std::string error;

    static FinalizeResult success() { return FinalizeResult{true, ""}; }
    static FinalizeResult failure(std::string reason) { return FinalizeResult{false, std::move(reason)}; }
};

/**
 * @brief Persistence boundary used by ReassemblyManager
 *
 * Implementations must tolerate concurrent writeChunk() calls for the
 * same staging path at disjoint offsets. Failures are reported through
 * return values, never thrown.
 */
class IStorageBackend {
public:
    virtual ~IStorageBackend() = default;

    virtual tsr::Result<void> writeChunk(const std::string& destinationPath,
                                         uint64_t offset,
                                         const std::vector<uint8_t>& data) = 0;

    virtual FinalizeResult verifyAndFinalize(const FinalizeRequest& request) = 0;

    /// Drop whatever was staged at stagingPath; missing data is not an error
    virtual void discard(const std::string& stagingPath) = 0;
};

} // namespace Transfer
} // namespace Tessera
