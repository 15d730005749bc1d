/**
 * @file SqliteDatabase.hpp
 * @brief Thin RAII wrappers over a sqlite3 connection and prepared statements.
 */

#pragma once
#include <string>
#include <functional>
#include <sqlite3.h>

namespace engram::infrastructure {

/**
 * @class SqliteDatabase
 * @brief Owns one sqlite3 connection, opened in WAL mode.
 *
 * Opening throws std::runtime_error; statement failures throw domain::StorageError.
 */
class SqliteDatabase {
public:
    explicit SqliteDatabase(const std::string& path);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    sqlite3* handle() const { return m_db; }
    const std::string& path() const { return m_path; }

    /** @brief Executes one or more statements without results. */
    void exec(const std::string& sql);

    /**
     * @brief Runs work inside BEGIN IMMEDIATE / COMMIT.
     * Nested calls join the outermost transaction. On exception the outermost
     * level rolls back and the exception is rethrown.
     */
    void transaction(const std::function<void()>& work);

    std::string lastError() const;

private:
    sqlite3* m_db = nullptr;
    std::string m_path;
    int m_transactionDepth = 0;
};

/**
 * @class SqliteStatement
 * @brief Prepared statement finalized on destruction. Parameters are 1-based.
 */
class SqliteStatement {
public:
    SqliteStatement(SqliteDatabase& db, const std::string& sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    void bindText(int index, const std::string& value);
    void bindInt64(int index, long long value);
    void bindDouble(int index, double value);

    /**
     * @brief Advances the statement.
     * @return true when a row is available, false when done.
     * @throws domain::StorageError Duplicate on a primary key violation, IOFailure otherwise.
     */
    bool step();

    /** @brief Resets for re-execution and clears bindings. */
    void reset();

    std::string columnText(int column) const;
    long long columnInt64(int column) const;
    double columnDouble(int column) const;

private:
    SqliteDatabase& m_db;
    sqlite3_stmt* m_stmt = nullptr;
};

} // namespace engram::infrastructure
