/**
 * @file SnapshotStore.hpp
 * @brief On-disk layout of persisted state snapshots: primary, backup and dated archive.
 */

#pragma once
#include <filesystem>
#include <vector>
#include "domain/PersistedState.hpp"

namespace engram::infrastructure {

/**
 * @class SnapshotStore
 * @brief Writes each snapshot three times and lists recovery candidates in priority order.
 *
 * Layout under root:
 *   engram_state.json
 *   backup/engram_state_backup.json
 *   archive/state_<YYYYMMDD_HHMMSS_mmm>.json
 */
class SnapshotStore {
public:
    SnapshotStore(std::filesystem::path root, size_t retention);

    /**
     * @brief Atomically writes primary, then backup, then a new dated copy,
     * then prunes the dated copies down to the retention count.
     * @throws domain::StorageError (IOFailure) on the first failed write.
     */
    void write(const domain::PersistedState& state);

    /**
     * @brief Reads and decodes one snapshot file.
     * @throws domain::StorageError NotFound / Corrupt / IOFailure.
     */
    domain::PersistedState read(const std::filesystem::path& path) const;

    /** @brief Primary, backup, then dated copies newest first. */
    std::vector<std::filesystem::path> recoveryCandidates() const;

    /** @brief Deletes the oldest dated copies beyond the retention count. */
    size_t prune();

    /** @brief Dated copies sorted oldest first. */
    std::vector<std::filesystem::path> archivedSnapshots() const;

    /** @brief True when no snapshot file of any kind exists (fresh install). */
    bool empty() const;

    std::filesystem::path primaryPath() const { return m_root / "engram_state.json"; }
    std::filesystem::path backupPath() const { return m_root / "backup" / "engram_state_backup.json"; }
    std::filesystem::path archiveDir() const { return m_root / "archive"; }

private:
    std::filesystem::path m_root;
    size_t m_retention;
};

} // namespace engram::infrastructure
