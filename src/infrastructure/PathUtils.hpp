// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace engram::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_DATA_HOME/engram, else ~/.local/share/engram, else the current directory. */
    static std::filesystem::path GetDataHome();

    static std::filesystem::path GetActiveDbPath(const std::filesystem::path& dataRoot);
    static std::filesystem::path GetArchiveDir(const std::filesystem::path& dataRoot);
    static std::filesystem::path GetArchiveIndexPath(const std::filesystem::path& dataRoot);
    static std::filesystem::path GetStateDir(const std::filesystem::path& dataRoot);
};

} // namespace engram::infrastructure
