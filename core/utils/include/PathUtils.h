#pragma once

#include <filesystem>
#include <string>

namespace Tessera {

/**
 * @brief XDG-style locations for Tessera's files
 *
 * getHome() and ensureDirectory() throw std::runtime_error when the
 * environment or the filesystem does not cooperate.
 */
class PathUtils {
public:
    static std::filesystem::path getHome();
    static std::filesystem::path getConfigDir();
    static std::filesystem::path getDataDir();
    static std::filesystem::path getLogDir();

    /// Default config file for an executable, e.g. ~/.config/tessera/relay.conf
    static std::filesystem::path getConfigFile(const std::string& name);

    /// Default resume database used by the peer
    static std::filesystem::path getProgressDatabasePath();

    /// "~" and "~/..." expanded against $HOME; other paths returned unchanged
    static std::string expandTilde(const std::string& path);

    static void ensureDirectory(const std::filesystem::path& dir);
};

} // namespace Tessera
