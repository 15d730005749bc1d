/**
 * @file ArchiveRepository.hpp
 * @brief Interface for the append-only, time-bucketed archive tier.
 */

#pragma once
#include <vector>
#include <string>
#include <optional>
#include <chrono>
#include <functional>
#include "Record.hpp"

namespace engram::domain {

/**
 * @struct ArchiveIndexEntry
 * @brief Denormalized projection of an archived record, used to avoid opening archive files.
 */
struct ArchiveIndexEntry {
    std::string id;
    std::string filePath;                 ///< Relative to the archive root.
    std::chrono::system_clock::time_point timestamp;
    std::vector<std::string> entities;
    float valence = 0.0f;
    RecordType recordType = RecordType::Interaction;
    std::string contentPreview;           ///< Bounded-length prefix of the content.
    std::vector<std::string> connections;
};

/**
 * @class ArchiveRepository
 * @brief Cold storage for evicted records: write-once files plus a metadata index.
 */
class ArchiveRepository {
public:
    virtual ~ArchiveRepository() = default;

    /**
     * @brief Writes records to a new file inside the bucket directory.
     * @return Path of the written file, relative to the archive root.
     * @throws StorageError (IOFailure) if the file cannot be written.
     */
    virtual std::string append(const std::vector<Record>& records, const std::string& bucketKey) = 0;

    /**
     * @brief Writes records to a fixed file name inside the bucket directory.
     * Used by bulk imports; refuses to overwrite an existing file.
     */
    virtual std::string appendNamed(const std::vector<Record>& records,
                                    const std::string& bucketKey,
                                    const std::string& fileName) = 0;

    /** @brief Inserts or replaces the index entry for a record. */
    virtual void index(const Record& record, const std::string& filePath) = 0;

    /**
     * @brief Candidate archive files for the given entities, deduplicated and capped.
     */
    virtual std::vector<std::string> findByEntities(const std::vector<std::string>& entities, size_t limit) = 0;

    /**
     * @brief Reads one archive file.
     * @throws StorageError (NotFound) for a missing file, (Corrupt) for unparsable content.
     */
    virtual std::vector<Record> load(const std::string& filePath) = 0;

    /** @brief Index entry for an archived id, if any. */
    virtual std::optional<ArchiveIndexEntry> findEntry(const std::string& id) = 0;

    /** @brief Number of indexed archived records. */
    virtual size_t archivedCount() = 0;

    /**
     * @brief Runs index writes atomically. Archive files are not covered:
     * a file whose rows were rolled back is simply never looked up.
     */
    virtual void transaction(const std::function<void()>& work) = 0;
};

} // namespace engram::domain
