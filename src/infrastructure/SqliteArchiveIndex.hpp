/**
 * @file SqliteArchiveIndex.hpp
 * @brief SQLite metadata index over archived records.
 */

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/ArchiveRepository.hpp"
#include "infrastructure/SqliteDatabase.hpp"

namespace engram::infrastructure {

/**
 * @class SqliteArchiveIndex
 * @brief One row per archived record, keyed by id, pointing at its archive file.
 */
class SqliteArchiveIndex {
public:
    SqliteArchiveIndex(const std::string& dbPath, size_t previewLength);

    /** @brief INSERT OR REPLACE the entry for record. */
    void upsert(const domain::Record& record, const std::string& filePath);

    /**
     * @brief Files holding records whose entity list matches any of the entities.
     * Newest first, deduplicated, at most limit paths.
     */
    std::vector<std::string> findFiles(const std::vector<std::string>& entities, size_t limit);

    std::optional<domain::ArchiveIndexEntry> find(const std::string& id);
    size_t count();

    /** @brief Groups upserts into one commit. */
    void transaction(const std::function<void()>& work) { m_db->transaction(work); }

private:
    void initSchema();

    std::unique_ptr<SqliteDatabase> m_db;
    size_t m_previewLength;
};

} // namespace engram::infrastructure
