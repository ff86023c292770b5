#include "ReassemblyManager.h"
#include "ChecksumVerifier.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "TransferProgressStore.h"

namespace Tessera {
namespace Transfer {

ChunkState TransferState::chunkState(size_t index) const {
    if (receivedChunks.count(index)) return ChunkState::Received;
    if (corruptedChunks.count(index)) return ChunkState::Corrupted;
    return ChunkState::Pending;
}

ReassemblyManager::ReassemblyManager(IStorageBackend& backend, TransferProgressStore* progress)
    : backend_(backend), progress_(progress) {
}

std::shared_ptr<ReassemblyManager::Entry> ReassemblyManager::find(const std::string& transferId) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = transfers_.find(transferId);
    if (it == transfers_.end()) {
        return nullptr;
    }
    return it->second;
}

tsr::Result<std::shared_ptr<ReassemblyManager::Entry>> ReassemblyManager::makeEntry(
        const std::string& transferId,
        const TransferManifest& manifest,
        const std::string& destinationPath) {
    auto valid = manifest.validate();
    if (!valid) {
        Logger::instance().warn("Rejecting manifest for " + transferId + ": " + valid.error().message, "ReassemblyManager");
        return valid.error();
    }

    auto entry = std::make_shared<Entry>();
    entry->state.transferId = transferId;
    entry->state.manifest = manifest;
    entry->state.destinationPath = destinationPath;
    entry->state.offsets = manifest.computeOffsets();
    return entry;
}

void ReassemblyManager::install(const std::string& transferId, std::shared_ptr<Entry> entry) {
    std::shared_ptr<Entry> previous;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto it = transfers_.find(transferId);
        if (it != transfers_.end()) {
            previous = it->second;
            it->second = std::move(entry);
        } else {
            transfers_.emplace(transferId, std::move(entry));
        }
    }

    if (previous) {
        std::lock_guard<std::mutex> lock(previous->mutex);
        previous->retired = true;
        Logger::instance().info("Replaced existing state for transfer " + transferId, "ReassemblyManager");
    }
}

void ReassemblyManager::retire(const std::string& transferId, const std::shared_ptr<Entry>& entry) {
    // Caller holds entry->mutex
    entry->retired = true;
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = transfers_.find(transferId);
    if (it != transfers_.end() && it->second == entry) {
        transfers_.erase(it);
    }
}

tsr::Result<void> ReassemblyManager::initReassembly(const std::string& transferId,
                                                    const TransferManifest& manifest,
                                                    const std::string& destinationPath) {
    auto entry = makeEntry(transferId, manifest, destinationPath);
    if (!entry) {
        return entry.error();
    }

    if (progress_ && !progress_->clearTransfer(transferId)) {
        Logger::instance().warn("Could not clear stored progress for transfer " + transferId, "ReassemblyManager");
        MetricsCollector::instance().incrementProgressWriteFailures();
    }

    install(transferId, std::move(*entry));
    MetricsCollector::instance().incrementTransfersStarted();
    Logger::instance().info("Initialized transfer " + transferId + " (" +
                            std::to_string(manifest.chunkCount()) + " chunks, " +
                            std::to_string(manifest.totalEncryptedSize()) + " encrypted bytes)", "ReassemblyManager");
    return tsr::Ok();
}

tsr::Result<void> ReassemblyManager::resumeReassembly(const std::string& transferId,
                                                      const TransferManifest& manifest,
                                                      const std::string& destinationPath) {
    if (!progress_) {
        return initReassembly(transferId, manifest, destinationPath);
    }

    auto entry = makeEntry(transferId, manifest, destinationPath);
    if (!entry) {
        return entry.error();
    }

    size_t ignored = 0;
    for (size_t index : progress_->loadChunks(transferId)) {
        if (index < manifest.chunkCount()) {
            (*entry)->state.receivedChunks.insert(index);
        } else {
            ++ignored;
        }
    }
    size_t restored = (*entry)->state.receivedChunks.size();

    install(transferId, std::move(*entry));
    MetricsCollector::instance().incrementTransfersStarted();

    std::string msg = "Resumed transfer " + transferId + " with " + std::to_string(restored) + "/" +
                      std::to_string(manifest.chunkCount()) + " chunks";
    if (ignored > 0) {
        msg += " (" + std::to_string(ignored) + " stale indices ignored)";
    }
    Logger::instance().info(msg, "ReassemblyManager");
    return tsr::Ok();
}

bool ReassemblyManager::acceptChunk(const std::string& transferId, size_t index, const std::vector<uint8_t>& data) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    auto entry = find(transferId);
    if (!entry) {
        logger.warn("Chunk " + std::to_string(index) + " for unknown transfer " + transferId, "ReassemblyManager");
        metrics.incrementChunksRejected();
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->retired) {
        metrics.incrementChunksRejected();
        return false;
    }

    TransferState& state = entry->state;
    if (index >= state.manifest.chunks.size()) {
        logger.warn("Chunk index " + std::to_string(index) + " out of range for transfer " + transferId +
                    " (" + std::to_string(state.manifest.chunks.size()) + " chunks)", "ReassemblyManager");
        metrics.incrementChunksRejected();
        return false;
    }

    const ChunkDescriptor& descriptor = state.manifest.chunks[index];
    if (descriptor.checksum && !ChecksumVerifier::matches(data, *descriptor.checksum)) {
        state.corruptedChunks.insert(index);
        if (state.receivedChunks.erase(index) > 0 && progress_ && !progress_->removeChunk(transferId, index)) {
            logger.warn("Could not drop stored progress for chunk " + std::to_string(index) + " of transfer " +
                        transferId + "; a resume would trust it", "ReassemblyManager");
            metrics.incrementProgressWriteFailures();
        }
        logger.warn("Checksum mismatch for chunk " + std::to_string(index) + " of transfer " + transferId, "ReassemblyManager");
        metrics.incrementChunksCorrupted();
        return false;
    }

    auto written = backend_.writeChunk(state.destinationPath, state.offsets[index], data);
    if (!written) {
        logger.error("Backend write failed for chunk " + std::to_string(index) + " of transfer " + transferId +
                     ": " + written.error().message, "ReassemblyManager");
        metrics.incrementBackendWriteFailures();
        return false;
    }

    state.corruptedChunks.erase(index);
    state.receivedChunks.insert(index);
    if (progress_ && !progress_->recordChunk(transferId, index)) {
        logger.warn("Could not record progress for chunk " + std::to_string(index) + " of transfer " + transferId,
                    "ReassemblyManager");
        metrics.incrementProgressWriteFailures();
    }

    metrics.incrementChunksAccepted();
    metrics.addBytesPersisted(data.size());
    if (logger.isDebugEnabled()) {
        logger.debug("Accepted chunk " + std::to_string(index) + " of transfer " + transferId + " (" +
                     std::to_string(state.receivedChunks.size()) + "/" +
                     std::to_string(state.manifest.chunks.size()) + ")", "ReassemblyManager");
    }
    return true;
}

bool ReassemblyManager::markChunkCorrupt(const std::string& transferId, size_t index) {
    auto entry = find(transferId);
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->retired || index >= entry->state.manifest.chunks.size()) {
        return false;
    }

    entry->state.receivedChunks.erase(index);
    entry->state.corruptedChunks.insert(index);
    if (progress_ && !progress_->removeChunk(transferId, index)) {
        Logger::instance().warn("Could not drop stored progress for chunk " + std::to_string(index) + " of transfer " +
                                transferId + "; a resume would trust it", "ReassemblyManager");
        MetricsCollector::instance().incrementProgressWriteFailures();
    }
    MetricsCollector::instance().incrementChunksCorrupted();
    Logger::instance().info("Chunk " + std::to_string(index) + " of transfer " + transferId + " marked corrupt", "ReassemblyManager");
    return true;
}

bool ReassemblyManager::finalize(const std::string& transferId,
                                 const std::string& destinationPath,
                                 const std::optional<std::string>& expectedDigest) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    auto entry = find(transferId);
    if (!entry) {
        logger.warn("Finalize requested for unknown transfer " + transferId, "ReassemblyManager");
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->retired) {
        return false;
    }

    const TransferState& state = entry->state;
    if (state.receivedChunks.size() != state.manifest.chunks.size()) {
        logger.warn("Transfer " + transferId + " incomplete: " + std::to_string(state.receivedChunks.size()) +
                    "/" + std::to_string(state.manifest.chunks.size()) + " chunks received", "ReassemblyManager");
        return false;
    }

    FinalizeRequest request;
    request.transferId = transferId;
    request.stagingPath = state.destinationPath;
    request.destinationPath = destinationPath;
    request.expectedDigest = expectedDigest;

    FinalizeResult result = backend_.verifyAndFinalize(request);
    if (!result.ok) {
        logger.error("Finalize failed for transfer " + transferId +
                     (result.error.empty() ? std::string() : ": " + result.error), "ReassemblyManager");
        metrics.incrementFinalizeFailures();
        return false;
    }

    retire(transferId, entry);
    if (progress_ && !progress_->clearTransfer(transferId)) {
        Logger::instance().warn("Could not clear stored progress for transfer " + transferId, "ReassemblyManager");
        MetricsCollector::instance().incrementProgressWriteFailures();
    }

    metrics.incrementTransfersFinalized();
    logger.info("Transfer " + transferId + " finalized to " + destinationPath, "ReassemblyManager");
    return true;
}

bool ReassemblyManager::abort(const std::string& transferId) {
    auto entry = find(transferId);
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->retired) {
        return false;
    }

    retire(transferId, entry);
    backend_.discard(entry->state.destinationPath);
    if (progress_ && !progress_->clearTransfer(transferId)) {
        Logger::instance().warn("Could not clear stored progress for transfer " + transferId, "ReassemblyManager");
        MetricsCollector::instance().incrementProgressWriteFailures();
    }

    MetricsCollector::instance().incrementTransfersAborted();
    Logger::instance().info("Transfer " + transferId + " aborted", "ReassemblyManager");
    return true;
}

std::optional<TransferState> ReassemblyManager::getState(const std::string& transferId) const {
    auto entry = find(transferId);
    if (!entry) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->retired) {
        return std::nullopt;
    }
    return entry->state;
}

bool ReassemblyManager::isComplete(const std::string& transferId) const {
    auto entry = find(transferId);
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    const TransferState& state = entry->state;
    return !entry->retired &&
           state.receivedChunks.size() == state.manifest.chunks.size() &&
           state.corruptedChunks.empty();
}

std::vector<size_t> ReassemblyManager::missingChunks(const std::string& transferId) const {
    std::vector<size_t> missing;
    auto entry = find(transferId);
    if (!entry) {
        return missing;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->retired) {
        return missing;
    }
    for (size_t i = 0; i < entry->state.manifest.chunks.size(); ++i) {
        if (!entry->state.receivedChunks.count(i)) {
            missing.push_back(i);
        }
    }
    return missing;
}

std::vector<std::string> ReassemblyManager::transferIds() const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    std::vector<std::string> ids;
    ids.reserve(transfers_.size());
    for (const auto& entry : transfers_) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace Transfer
} // namespace Tessera
