#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "IStorageBackend.h"
#include "Result.h"
#include "TransferManifest.h"

namespace Tessera {
namespace Transfer {

class TransferProgressStore;

enum class ChunkState {
    Pending,
    Received,
    Corrupted
};

/**
 * @brief Snapshot of one transfer being reassembled
 *
 * Invariants: receivedChunks and corruptedChunks are disjoint,
 * offsets.size() == manifest.chunks.size(), offsets[0] == 0.
 */
struct TransferState {
    std::string transferId;
    TransferManifest manifest;
    std::string destinationPath;
    std::vector<uint64_t> offsets;
    std::set<size_t> receivedChunks;
    std::set<size_t> corruptedChunks;

    ChunkState chunkState(size_t index) const;
};

/**
 * @brief Validates, positions and finalizes independently arriving chunks
 *
 * One instance is the registry of every active transfer in the process.
 * Calls for the same transfer are serialized by a per-transfer lock, so
 * concurrent acceptChunk() calls cannot race the completeness check in
 * finalize(); calls for different transfers proceed in parallel.
 *
 * Reassembly outcomes are booleans: false means rejected or failed, and the
 * caller decides whether to retry the chunk or abort the transfer.
 *
 * @code
 * FileStorageBackend backend;
 * ReassemblyManager manager(backend);
 * manager.initReassembly("t1", manifest, "/tmp/t1.part");
 * manager.acceptChunk("t1", 2, payload);
 * ...
 * if (manager.isComplete("t1")) manager.finalize("t1", "/home/me/file.bin");
 * @endcode
 */
class ReassemblyManager {
public:
    explicit ReassemblyManager(IStorageBackend& backend, TransferProgressStore* progress = nullptr);

    ReassemblyManager(const ReassemblyManager&) = delete;
    ReassemblyManager& operator=(const ReassemblyManager&) = delete;

    /**
     * @brief Register a transfer, replacing any previous state with the same id
     *
     * Offsets are computed here so chunk placement is O(1). No I/O is done.
     * Fails with InvalidManifest if the manifest breaks its invariants.
     */
    tsr::Result<void> initReassembly(const std::string& transferId,
                                     const TransferManifest& manifest,
                                     const std::string& destinationPath);

    /**
     * @brief Like initReassembly(), then restore receivedChunks from the progress store
     *
     * Without a progress store this is identical to initReassembly().
     */
    tsr::Result<void> resumeReassembly(const std::string& transferId,
                                       const TransferManifest& manifest,
                                       const std::string& destinationPath);

    /**
     * @brief Verify and persist one chunk
     *
     * False for an unknown transfer, an index outside the manifest, a
     * checksum mismatch (index recorded as corrupted) or a backend write
     * failure (state untouched so the chunk can be retried). A successful
     * retry of a corrupted index clears it from corruptedChunks.
     */
    bool acceptChunk(const std::string& transferId, size_t index, const std::vector<uint8_t>& data);

    /// Invalidate a chunk that was accepted earlier
    bool markChunkCorrupt(const std::string& transferId, size_t index);

    /**
     * @brief Hand a complete transfer to the backend for verification and assembly
     *
     * Returns false without contacting the backend unless every chunk has
     * been received. On backend success the transfer leaves the registry;
     * on failure the state is kept so finalize can be retried.
     */
    bool finalize(const std::string& transferId,
                  const std::string& destinationPath,
                  const std::optional<std::string>& expectedDigest = std::nullopt);

    /// Drop the transfer and its staged data; false if unknown
    bool abort(const std::string& transferId);

    std::optional<TransferState> getState(const std::string& transferId) const;
    bool isComplete(const std::string& transferId) const;
    std::vector<size_t> missingChunks(const std::string& transferId) const;
    std::vector<std::string> transferIds() const;

private:
    struct Entry {
        std::mutex mutex;
        TransferState state;
        bool retired = false;   // finalized or aborted while another caller waited
    };

    std::shared_ptr<Entry> find(const std::string& transferId) const;
    tsr::Result<std::shared_ptr<Entry>> makeEntry(const std::string& transferId,
                                                  const TransferManifest& manifest,
                                                  const std::string& destinationPath);
    void install(const std::string& transferId, std::shared_ptr<Entry> entry);
    void retire(const std::string& transferId, const std::shared_ptr<Entry>& entry);

    IStorageBackend& backend_;
    TransferProgressStore* progress_;

    mutable std::mutex registryMutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> transfers_;
};

} // namespace Transfer
} // namespace Tessera
