#include "FileStorageBackend.h"
#include "ChecksumVerifier.h"
#include "Logger.h"
#include "SHA256.h"
#include "SocketGuard.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace Tessera {
namespace Transfer {

namespace fs = std::filesystem;

tsr::Result<void> FileStorageBackend::ensureParentDirectory(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return tsr::Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return tsr::Err(tsr::ErrorCode::DirectoryCreateFailed,
                        "cannot create " + parent.string() + ": " + ec.message());
    }
    return tsr::Ok();
}

tsr::Result<void> FileStorageBackend::writeChunk(const std::string& destinationPath,
                                                 uint64_t offset,
                                                 const std::vector<uint8_t>& data) {
    auto dir = ensureParentDirectory(destinationPath);
    if (!dir) {
        return dir;
    }

    tsr::SocketGuard fd(::open(destinationPath.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644));
    if (!fd) {
        return tsr::Err(errno == EACCES ? tsr::ErrorCode::FileAccessDenied : tsr::ErrorCode::FileWriteError,
                        "open " + destinationPath + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::pwrite(fd.get(), data.data() + written, data.size() - written,
                             static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return tsr::Err(tsr::ErrorCode::FileWriteError,
                            "pwrite " + destinationPath + " at " + std::to_string(offset + written) +
                            ": " + std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }

    if (options_.syncWrites && ::fsync(fd.get()) != 0) {
        return tsr::Err(tsr::ErrorCode::FileWriteError,
                        "fsync " + destinationPath + ": " + std::strerror(errno));
    }

    if (int err = fd.close()) {
        return tsr::Err(tsr::ErrorCode::FileWriteError,
                        "close " + destinationPath + ": " + std::strerror(err));
    }
    return tsr::Ok();
}

FinalizeResult FileStorageBackend::verifyAndFinalize(const FinalizeRequest& request) {
    auto& logger = Logger::instance();
    std::error_code ec;

    if (!fs::exists(request.stagingPath, ec)) {
        return FinalizeResult::failure("staged file missing: " + request.stagingPath);
    }

    if (request.expectedDigest) {
        std::string actual = SHA256::hashFile(request.stagingPath);
        if (actual.empty()) {
            return FinalizeResult::failure("cannot hash staged file " + request.stagingPath);
        }
        if (!ChecksumVerifier::digestsEqual(actual, *request.expectedDigest)) {
            logger.warn("Digest mismatch for transfer " + request.transferId +
                        ": expected " + *request.expectedDigest + ", got " + actual, "FileStorageBackend");
            return FinalizeResult::failure("digest mismatch");
        }
    }

    if (request.destinationPath.empty() || request.destinationPath == request.stagingPath) {
        return FinalizeResult::success();
    }

    auto dir = ensureParentDirectory(request.destinationPath);
    if (!dir) {
        return FinalizeResult::failure(dir.error().message);
    }

    fs::rename(request.stagingPath, request.destinationPath, ec);
    if (ec) {
        // rename(2) cannot cross filesystems; fall back to copy + remove
        logger.debug("rename failed (" + ec.message() + "), copying " + request.stagingPath, "FileStorageBackend");
        ec.clear();
        fs::copy_file(request.stagingPath, request.destinationPath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return FinalizeResult::failure("cannot move staged file to " + request.destinationPath + ": " + ec.message());
        }
        fs::remove(request.stagingPath, ec);
        if (ec) {
            logger.warn("Staged file left behind at " + request.stagingPath + ": " + ec.message(), "FileStorageBackend");
        }
    }

    logger.info("Finalized transfer " + request.transferId + " -> " + request.destinationPath, "FileStorageBackend");
    return FinalizeResult::success();
}

void FileStorageBackend::discard(const std::string& stagingPath) {
    std::error_code ec;
    fs::remove(stagingPath, ec);
    if (ec) {
        Logger::instance().warn("Cannot discard " + stagingPath + ": " + ec.message(), "FileStorageBackend");
    }
}

} // namespace Transfer
} // namespace Tessera
