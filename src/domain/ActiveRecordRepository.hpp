/**
 * @file ActiveRecordRepository.hpp
 * @brief Interface for the fast, fully indexed active tier.
 */

#pragma once
#include <vector>
#include <string>
#include <optional>
#include <functional>
#include "Record.hpp"

namespace engram::domain {

/**
 * @class ActiveRecordRepository
 * @brief Abstract store holding the most recent records plus an entity index.
 *
 * Storage failures are reported as StorageError.
 */
class ActiveRecordRepository {
public:
    virtual ~ActiveRecordRepository() = default;

    /**
     * @brief Adds a record and one index entry per entity.
     * @throws StorageError (Duplicate) if the id already exists.
     */
    virtual void insert(const Record& record) = 0;

    /**
     * @brief Distinct records sharing at least one entity with the query, newest first.
     * @param entities Query set. Empty yields an empty result.
     * @param limit Maximum number of records returned.
     */
    virtual std::vector<Record> queryByEntities(const std::vector<std::string>& entities, size_t limit) = 0;

    /** @brief Newest n records, newest first. */
    virtual std::vector<Record> recent(size_t n) = 0;

    /** @brief Oldest n records, oldest first. */
    virtual std::vector<Record> oldest(size_t n) = 0;

    /** @brief Every active record, oldest first. */
    virtual std::vector<Record> all() = 0;

    /** @brief Looks up a single record. */
    virtual std::optional<Record> findById(const std::string& id) = 0;

    /** @brief Removes records and their index entries. Unknown ids are ignored. */
    virtual void remove(const std::vector<std::string>& ids) = 0;

    /**
     * @brief Replaces content, entities, connections and valence of an existing record.
     * @throws StorageError (NotFound) if the id is absent.
     */
    virtual void update(const Record& record) = 0;

    /** @brief Number of active records. */
    virtual size_t count() = 0;

    /**
     * @brief Runs work atomically: all writes inside commit together or not at all.
     * Exceptions thrown by work are rethrown after rollback.
     */
    virtual void transaction(const std::function<void()>& work) = 0;
};

} // namespace engram::domain
