#include "TransferProgressStore.h"
#include "Logger.h"

#include <chrono>
#include <filesystem>

namespace Tessera {
namespace Transfer {

TransferProgressStore::~TransferProgressStore() {
    close();
}

tsr::Result<void> TransferProgressStore::open(const std::string& dbPath) {
    auto& logger = Logger::instance();
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        return tsr::Err(tsr::ErrorCode::DatabaseError, "progress store already open");
    }

    if (dbPath != ":memory:") {
        std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                logger.error("Failed to create database directory: " + parent.string() + " (" + ec.message() + ")", "TransferProgressStore");
            }
        }
    }

    if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
        std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
        logger.error("Cannot open progress database " + dbPath + ": " + reason, "TransferProgressStore");
        sqlite3_close(db_);
        db_ = nullptr;
        return tsr::Err(tsr::ErrorCode::DatabaseOpenFailed, reason);
    }

    char* errMsg = nullptr;
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &errMsg) != SQLITE_OK) {
        logger.warn("Failed to enable WAL mode: " + std::string(errMsg ? errMsg : "unknown"), "TransferProgressStore");
        sqlite3_free(errMsg);
    }
    sqlite3_busy_timeout(db_, 5000);

    if (!createTables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return tsr::Err(tsr::ErrorCode::DatabaseError, "cannot create progress schema");
    }

    logger.info("Progress database opened: " + dbPath, "TransferProgressStore");
    return tsr::Ok();
}

void TransferProgressStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool TransferProgressStore::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool TransferProgressStore::createTables() {
    const char* sql =
        "CREATE TABLE IF NOT EXISTS transfer_chunks ("
        "transfer_id TEXT NOT NULL,"
        "chunk_index INTEGER NOT NULL,"
        "recorded_at INTEGER NOT NULL,"
        "PRIMARY KEY (transfer_id, chunk_index));"
        "PRAGMA user_version = 1;";

    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        Logger::instance().error("Failed to create tables: " + std::string(errMsg ? errMsg : "unknown"), "TransferProgressStore");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool TransferProgressStore::execute(const char* sql, const std::string& transferId, size_t index, bool bindIndex) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::instance().error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)), "TransferProgressStore");
        return false;
    }

    sqlite3_bind_text(stmt, 1, transferId.c_str(), -1, SQLITE_TRANSIENT);
    if (bindIndex) {
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(index));
        auto now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        if (sqlite3_bind_parameter_count(stmt) >= 3) {
            sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(now));
        }
    }

    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (!ok) {
        Logger::instance().error("Statement failed: " + std::string(sqlite3_errmsg(db_)), "TransferProgressStore");
    }
    sqlite3_finalize(stmt);
    return ok;
}

bool TransferProgressStore::recordChunk(const std::string& transferId, size_t index) {
    return execute("INSERT OR IGNORE INTO transfer_chunks (transfer_id, chunk_index, recorded_at) VALUES (?, ?, ?);",
                   transferId, index, true);
}

bool TransferProgressStore::removeChunk(const std::string& transferId, size_t index) {
    return execute("DELETE FROM transfer_chunks WHERE transfer_id = ? AND chunk_index = ?;",
                   transferId, index, true);
}

bool TransferProgressStore::clearTransfer(const std::string& transferId) {
    return execute("DELETE FROM transfer_chunks WHERE transfer_id = ?;", transferId, 0, false);
}

std::vector<size_t> TransferProgressStore::loadChunks(const std::string& transferId) const {
    std::vector<size_t> indices;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return indices;
    }

    const char* sql = "SELECT chunk_index FROM transfer_chunks WHERE transfer_id = ? ORDER BY chunk_index ASC;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Logger::instance().error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)), "TransferProgressStore");
        return indices;
    }

    sqlite3_bind_text(stmt, 1, transferId.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        sqlite3_int64 value = sqlite3_column_int64(stmt, 0);
        if (value >= 0) {
            indices.push_back(static_cast<size_t>(value));
        }
    }
    sqlite3_finalize(stmt);
    return indices;
}

std::vector<std::string> TransferProgressStore::listTransfers() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return ids;
    }

    const char* sql = "SELECT DISTINCT transfer_id FROM transfer_chunks ORDER BY transfer_id;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return ids;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        if (text) {
            ids.emplace_back(reinterpret_cast<const char*>(text));
        }
    }
    sqlite3_finalize(stmt);
    return ids;
}

} // namespace Transfer
} // namespace Tessera
