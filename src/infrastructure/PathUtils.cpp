#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace engram::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome) / "engram";
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share" / "engram";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetActiveDbPath(const fs::path& dataRoot) {
    return dataRoot / "active_memory.db";
}

fs::path PathUtils::GetArchiveDir(const fs::path& dataRoot) {
    return dataRoot / "archive";
}

fs::path PathUtils::GetArchiveIndexPath(const fs::path& dataRoot) {
    return dataRoot / "archive_index.db";
}

fs::path PathUtils::GetStateDir(const fs::path& dataRoot) {
    return dataRoot / "state";
}

} // namespace engram::infrastructure
