/**
 * @file LegacyMigrator.hpp
 * @brief Imports a legacy single-file record stream into the two tiers.
 */

#pragma once

#include <string>
#include "application/MemoryManager.hpp"

namespace engram::application {

struct MigrationReport {
    size_t active = 0;    ///< Records inserted into the active tier.
    size_t archived = 0;  ///< Records written to archive files.
    size_t skipped = 0;   ///< Records whose id was already stored.
};

/**
 * @class LegacyMigrator
 * @brief Reads {"memories":[...]} with fields id, content, timestamp, entities,
 * connections, memory_type, emotional_valence.
 *
 * The newest active_limit records go to the active tier; the rest are written
 * per month to <YYYY-MM>/migrated_archive.json and indexed. Writes go
 * straight to the tiers; run it while no other thread uses the manager.
 */
class LegacyMigrator {
public:
    explicit LegacyMigrator(MemoryManager& manager);

    /**
     * @brief Migrates the file at path.
     * @throws domain::StorageError NotFound if missing, Corrupt if unparsable.
     */
    MigrationReport migrateFile(const std::string& path);

    /** @brief Migrates legacy JSON text. */
    MigrationReport migrate(const std::string& jsonText);

private:
    MemoryManager& m_manager;
};

} // namespace engram::application
