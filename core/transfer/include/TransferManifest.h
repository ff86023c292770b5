#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "Result.h"

namespace Tessera {
namespace Transfer {

/**
 * @brief One encrypted slice of a transfer
 *
 * `checksum` is the hex SHA-256 of the encrypted payload; chunks without
 * one are persisted unverified.
 */
struct ChunkDescriptor {
    size_t index{0};
    uint64_t encryptedSize{0};
    std::optional<std::string> checksum;
};

/**
 * @brief Ordered description of every chunk of one transfer
 *
 * External form:
 * @code
 * {"fileSize": 3000,
 *  "chunks": [{"index": 0, "encryptedSize": 1000, "checksum": "ab12..."}, ...]}
 * @endcode
 *
 * The sum of encryptedSize need not equal fileSize (encryption framing adds
 * bytes), but indices must cover [0, chunks.size()) exactly once.
 */
struct TransferManifest {
    uint64_t fileSize{0};
    std::vector<ChunkDescriptor> chunks;

    size_t chunkCount() const { return chunks.size(); }

    /// Sum of encryptedSize over all chunks
    uint64_t totalEncryptedSize() const;

    /// offsets[i] = sum of encryptedSize for chunks 0..i-1
    std::vector<uint64_t> computeOffsets() const;

    /**
     * @brief Check the structural invariants
     *
     * Fails with InvalidManifest when fileSize is zero, the chunk list is
     * empty, any encryptedSize is zero, or chunks[i].index != i.
     */
    tsr::Result<void> validate() const;

    Json::Value toJson() const;
    std::string toString() const;

    /// Chunks are sorted by index; the result is validated
    static tsr::Result<TransferManifest> fromJson(const Json::Value& root);
    static tsr::Result<TransferManifest> fromString(const std::string& text);
    static tsr::Result<TransferManifest> loadFromFile(const std::string& path);
};

} // namespace Transfer
} // namespace Tessera
