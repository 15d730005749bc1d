/**
 * @file ArchiveStoreFs.hpp
 * @brief Filesystem implementation of the archive tier.
 */

#pragma once
#include <filesystem>
#include <memory>
#include "domain/ArchiveRepository.hpp"
#include "infrastructure/SqliteArchiveIndex.hpp"

namespace engram::infrastructure {

/**
 * @class ArchiveStoreFs
 * @brief Month-bucketed, write-once JSON files under an archive root, indexed in SQLite.
 *
 * Layout: <root>/<YYYY-MM>/archive_<YYYYMMDD_HHMMSS>[_NNNN].json
 */
class ArchiveStoreFs : public domain::ArchiveRepository {
public:
    /**
     * @param archiveRoot Directory holding bucket subdirectories.
     * @param indexDbPath SQLite file for the metadata index.
     * @param previewLength Characters of content kept in each index entry.
     */
    ArchiveStoreFs(std::filesystem::path archiveRoot, const std::string& indexDbPath, size_t previewLength = 200);

    std::string append(const std::vector<domain::Record>& records, const std::string& bucketKey) override;
    std::string appendNamed(const std::vector<domain::Record>& records,
                            const std::string& bucketKey,
                            const std::string& fileName) override;
    void index(const domain::Record& record, const std::string& filePath) override;
    std::vector<std::string> findByEntities(const std::vector<std::string>& entities, size_t limit) override;
    std::vector<domain::Record> load(const std::string& filePath) override;
    std::optional<domain::ArchiveIndexEntry> findEntry(const std::string& id) override;
    size_t archivedCount() override;
    void transaction(const std::function<void()>& work) override;

    /** @brief Bucket key ("YYYY-MM", UTC) for a record timestamp. */
    static std::string BucketKeyFor(std::chrono::system_clock::time_point timestamp);

    const std::filesystem::path& root() const { return m_root; }

private:
    std::filesystem::path resolve(const std::string& relativePath) const;

    std::filesystem::path m_root;
    std::unique_ptr<SqliteArchiveIndex> m_index;
};

} // namespace engram::infrastructure
