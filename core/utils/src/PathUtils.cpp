#include "PathUtils.h"
#include <cstdlib>
#include <stdexcept>
#include <system_error>

namespace Tessera {

std::filesystem::path PathUtils::getHome() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home);
    }
    throw std::runtime_error("HOME environment variable is not set");
}

std::filesystem::path PathUtils::getConfigDir() {
    if (const char* config = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(config) / "tessera";
    }
    return getHome() / ".config" / "tessera";
}

std::filesystem::path PathUtils::getDataDir() {
    if (const char* data = std::getenv("XDG_DATA_HOME")) {
        return std::filesystem::path(data) / "tessera";
    }
    return getHome() / ".local" / "share" / "tessera";
}

std::filesystem::path PathUtils::getLogDir() {
    if (const char* state = std::getenv("XDG_STATE_HOME")) {
        return std::filesystem::path(state) / "tessera";
    }
    return getHome() / ".local" / "state" / "tessera";
}

std::filesystem::path PathUtils::getConfigFile(const std::string& name) {
    return getConfigDir() / (name + ".conf");
}

std::filesystem::path PathUtils::getProgressDatabasePath() {
    return getDataDir() / "transfers.db";
}

std::string PathUtils::expandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;    // ~user is not supported
    }

    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

void PathUtils::ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir, ec);
    }
    if (ec) {
        throw std::runtime_error("Failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    }
}

} // namespace Tessera
