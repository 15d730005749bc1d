/**
 * @file EngramConfig.hpp
 * @brief Tunable limits and thresholds for the record tiers and snapshots.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace engram::domain {

/**
 * @struct EngramConfig
 * @brief Settings loaded from settings.json; defaults match a fresh install.
 */
struct EngramConfig {
    size_t activeLimit = 200;              ///< Max records kept in the active tier.
    size_t evictionBatch = 50;             ///< Records moved per archival pass.
    float connectionThreshold = 0.7f;      ///< Strong entity overlap for a connection.
    float weakConnectionThreshold = 0.3f;  ///< Overlap needed when valences are close.
    float valenceProximity = 0.3f;         ///< Max valence gap for a weak connection.
    float mergeThreshold = 0.7f;           ///< Overlap above which records are merged.
    size_t archiveLookupFiles = 3;         ///< Archive files opened per recall.
    size_t previewLength = 200;            ///< Characters kept in the archive index.
    size_t mergeExcerptLength = 150;       ///< Characters of a merged record kept.
    size_t snapshotRetention = 100;        ///< Dated snapshots kept on disk.
    uint64_t snapshotIntervalMs = 30000;   ///< Background snapshot period.

    /**
     * @brief Rejects values that would break the tiering invariants.
     * @throws std::invalid_argument naming the offending key.
     */
    void validate() const {
        if (activeLimit == 0) {
            throw std::invalid_argument("active_limit must be > 0");
        }
        if (evictionBatch == 0 || evictionBatch > activeLimit) {
            throw std::invalid_argument("eviction_batch must be in [1, active_limit]");
        }
        checkRatio("connection_threshold", connectionThreshold);
        checkRatio("weak_connection_threshold", weakConnectionThreshold);
        checkRatio("valence_proximity", valenceProximity);
        checkRatio("merge_threshold", mergeThreshold);
        if (archiveLookupFiles == 0) {
            throw std::invalid_argument("archive_lookup_files must be > 0");
        }
        if (snapshotRetention == 0) {
            throw std::invalid_argument("snapshot_retention must be > 0");
        }
        if (snapshotIntervalMs == 0) {
            throw std::invalid_argument("snapshot_interval_ms must be > 0");
        }
    }

private:
    static void checkRatio(const std::string& key, float value) {
        if (!(value > 0.0f && value <= 1.0f)) {
            throw std::invalid_argument(key + " must be in (0, 1]");
        }
    }
};

} // namespace engram::domain
