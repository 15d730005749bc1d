/**
 * @file SnapshotStore.cpp
 * @brief Implementation of SnapshotStore.
 */

#include "infrastructure/SnapshotStore.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/TimeUtils.hpp"
#include "domain/StorageError.hpp"
#include <algorithm>
#include <iostream>

namespace engram::infrastructure {

namespace fs = std::filesystem;

SnapshotStore::SnapshotStore(fs::path root, size_t retention)
    : m_root(std::move(root)), m_retention(retention) {}

void SnapshotStore::write(const domain::PersistedState& state) {
    const std::string content = JsonCodec::EncodeState(state);

    AtomicFileWriter::write(primaryPath(), content);
    AtomicFileWriter::write(backupPath(), content);

    // Dated copies are never replaced; same-millisecond writes get a suffix
    AtomicFileWriter::writeNumbered(archiveDir(), "state_" + TimeUtils::SortableStampNow(), content);

    prune();
}

domain::PersistedState SnapshotStore::read(const fs::path& path) const {
    return JsonCodec::DecodeState(AtomicFileWriter::read(path));
}

std::vector<fs::path> SnapshotStore::archivedSnapshots() const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::exists(archiveDir(), ec)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(archiveDir(), ec)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (name.rfind("state_", 0) == 0 && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        std::cerr << "[SnapshotStore] Cannot list " << archiveDir() << ": " << ec.message() << std::endl;
    }

    // Stamps sort lexically in time order
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

bool SnapshotStore::empty() const {
    std::error_code ec;
    return !fs::exists(primaryPath(), ec) && !fs::exists(backupPath(), ec) && archivedSnapshots().empty();
}

std::vector<fs::path> SnapshotStore::recoveryCandidates() const {
    std::vector<fs::path> candidates{primaryPath(), backupPath()};
    auto dated = archivedSnapshots();
    candidates.insert(candidates.end(), dated.rbegin(), dated.rend());
    return candidates;
}

size_t SnapshotStore::prune() {
    auto files = archivedSnapshots();
    if (files.size() <= m_retention) {
        return 0;
    }

    size_t removed = 0;
    size_t excess = files.size() - m_retention;
    for (size_t i = 0; i < excess; ++i) {
        std::error_code ec;
        if (fs::remove(files[i], ec)) {
            ++removed;
        } else if (ec) {
            std::cerr << "[SnapshotStore] Failed to prune " << files[i] << ": " << ec.message() << std::endl;
        }
    }
    return removed;
}

} // namespace engram::infrastructure
