/**
 * @file SqliteDatabase.cpp
 * @brief Implementation of SqliteDatabase and SqliteStatement.
 */

#include "infrastructure/SqliteDatabase.hpp"
#include "domain/StorageError.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace engram::infrastructure {

using domain::ErrorKind;
using domain::StorageError;

SqliteDatabase::SqliteDatabase(const std::string& path) : m_path(path) {
    auto parent = std::filesystem::path(m_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    int rc = sqlite3_open_v2(m_path.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string err = m_db ? sqlite3_errmsg(m_db) : "unknown error";
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        throw std::runtime_error("Failed to open database " + m_path + ": " + err);
    }

    sqlite3_busy_timeout(m_db, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
}

SqliteDatabase::~SqliteDatabase() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void SqliteDatabase::exec(const std::string& sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string err = errMsg ? errMsg : sqlite3_errmsg(m_db);
        sqlite3_free(errMsg);
        throw StorageError(ErrorKind::IOFailure, "SQL error on " + m_path + ": " + err);
    }
}

void SqliteDatabase::transaction(const std::function<void()>& work) {
    if (m_transactionDepth > 0) {
        ++m_transactionDepth;
        try {
            work();
        } catch (...) {
            --m_transactionDepth;
            throw;
        }
        --m_transactionDepth;
        return;
    }

    exec("BEGIN IMMEDIATE;");
    m_transactionDepth = 1;
    try {
        work();
        exec("COMMIT;");
        m_transactionDepth = 0;
    } catch (...) {
        m_transactionDepth = 0;
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::cerr << "[SqliteDatabase] Rollback failed on " << m_path << ": "
                      << (errMsg ? errMsg : "unknown error") << std::endl;
        }
        sqlite3_free(errMsg);
        throw;
    }
}

std::string SqliteDatabase::lastError() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

SqliteStatement::SqliteStatement(SqliteDatabase& db, const std::string& sql) : m_db(db) {
    if (sqlite3_prepare_v2(m_db.handle(), sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
        std::string err = m_db.lastError();
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
        }
        throw StorageError(ErrorKind::IOFailure, "Failed to prepare statement: " + err);
    }
}

SqliteStatement::~SqliteStatement() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

void SqliteStatement::bindText(int index, const std::string& value) {
    sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void SqliteStatement::bindInt64(int index, long long value) {
    sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(value));
}

void SqliteStatement::bindDouble(int index, double value) {
    sqlite3_bind_double(m_stmt, index, value);
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;

    std::string err = m_db.lastError();
    int extended = sqlite3_extended_errcode(m_db.handle());
    if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        throw StorageError(ErrorKind::Duplicate, "Constraint violation: " + err);
    }
    throw StorageError(ErrorKind::IOFailure, "Statement failed: " + err);
}

void SqliteStatement::reset() {
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
}

std::string SqliteStatement::columnText(int column) const {
    const unsigned char* text = sqlite3_column_text(m_stmt, column);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(m_stmt, column)));
}

long long SqliteStatement::columnInt64(int column) const {
    return static_cast<long long>(sqlite3_column_int64(m_stmt, column));
}

double SqliteStatement::columnDouble(int column) const {
    return sqlite3_column_double(m_stmt, column);
}

} // namespace engram::infrastructure
