#pragma once

#include "IStorageBackend.h"

namespace Tessera {
namespace Transfer {

/**
 * @brief Local filesystem storage backend
 *
 * Chunks are written with pwrite() into a sparse staging file, so arrival
 * order does not matter. verifyAndFinalize() hashes the staged file when
 * an expected digest is supplied and then moves it onto the destination.
 */
class FileStorageBackend : public IStorageBackend {
public:
    struct Options {
        bool syncWrites = false;    // fsync after every chunk
    };

    FileStorageBackend() = default;
    explicit FileStorageBackend(Options options) : options_(options) {}

    tsr::Result<void> writeChunk(const std::string& destinationPath,
                                 uint64_t offset,
                                 const std::vector<uint8_t>& data) override;

    FinalizeResult verifyAndFinalize(const FinalizeRequest& request) override;

    void discard(const std::string& stagingPath) override;

private:
    Options options_;

    static tsr::Result<void> ensureParentDirectory(const std::string& path);
};

} // namespace Transfer
} // namespace Tessera
