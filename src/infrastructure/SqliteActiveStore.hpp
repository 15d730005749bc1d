/**
 * @file SqliteActiveStore.hpp
 * @brief SQLite implementation of the active record tier.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/ActiveRecordRepository.hpp"
#include "infrastructure/SqliteDatabase.hpp"

namespace engram::infrastructure {

/**
 * @class SqliteActiveStore
 * @brief Records table plus an (entity, record_id) index table in one database file.
 *
 * Timestamps are stored as integer microseconds; ties are broken by insertion order.
 */
class SqliteActiveStore : public domain::ActiveRecordRepository {
public:
    /**
     * @brief Opens (creating if needed) the database and its schema.
     * @throws std::runtime_error if the file cannot be opened.
     */
    explicit SqliteActiveStore(const std::string& dbPath);

    void insert(const domain::Record& record) override;
    std::vector<domain::Record> queryByEntities(const std::vector<std::string>& entities, size_t limit) override;
    std::vector<domain::Record> recent(size_t n) override;
    std::vector<domain::Record> oldest(size_t n) override;
    std::vector<domain::Record> all() override;
    std::optional<domain::Record> findById(const std::string& id) override;
    void remove(const std::vector<std::string>& ids) override;
    void update(const domain::Record& record) override;
    size_t count() override;
    void transaction(const std::function<void()>& work) override;

private:
    void initSchema();
    bool exists(const std::string& id);
    void writeIndex(const domain::Record& record);
    void dropIndex(const std::string& id);
    std::vector<domain::Record> selectMany(const std::string& sqlTail, long long limit);
    static domain::Record readRow(const SqliteStatement& stmt);

    std::unique_ptr<SqliteDatabase> m_db;
};

} // namespace engram::infrastructure
