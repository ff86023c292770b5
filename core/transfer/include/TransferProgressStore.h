#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "Result.h"

namespace Tessera {
namespace Transfer {

/**
 * @brief SQLite record of persisted chunk indices per transfer
 *
 * Lets a restarted process call ReassemblyManager::resumeReassembly()
 * instead of fetching every chunk again. Pass ":memory:" for a private
 * in-memory database.
 */
class TransferProgressStore {
public:
    TransferProgressStore() = default;
    ~TransferProgressStore();

    TransferProgressStore(const TransferProgressStore&) = delete;
    TransferProgressStore& operator=(const TransferProgressStore&) = delete;

    tsr::Result<void> open(const std::string& dbPath);
    void close();
    bool isOpen() const;

    bool recordChunk(const std::string& transferId, size_t index);
    bool removeChunk(const std::string& transferId, size_t index);
    bool clearTransfer(const std::string& transferId);

    /// Ascending indices recorded for transferId
    std::vector<size_t> loadChunks(const std::string& transferId) const;
    std::vector<std::string> listTransfers() const;

private:
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;

    bool createTables();
    bool execute(const char* sql, const std::string& transferId, size_t index, bool bindIndex);
};

} // namespace Transfer
} // namespace Tessera
