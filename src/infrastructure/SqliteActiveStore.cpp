/**
 * @file SqliteActiveStore.cpp
 * @brief Implementation of SqliteActiveStore.
 */

#include "infrastructure/SqliteActiveStore.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "domain/StorageError.hpp"
#include <limits>

namespace engram::infrastructure {

using domain::ErrorKind;
using domain::Record;
using domain::StorageError;

namespace {

const char* kColumns =
    "id, content, timestamp, record_type, valence, entities, connections, source, confidence";

long long ToMicros(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromMicros(long long micros) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(micros)));
}

long long ToSqlLimit(size_t n) {
    // SQLite treats a negative LIMIT as "no limit"
    const size_t maxLimit = static_cast<size_t>(std::numeric_limits<long long>::max());
    return n >= maxLimit ? -1 : static_cast<long long>(n);
}

} // namespace

SqliteActiveStore::SqliteActiveStore(const std::string& dbPath)
    : m_db(std::make_unique<SqliteDatabase>(dbPath)) {
    initSchema();
}

void SqliteActiveStore::initSchema() {
    m_db->exec(
        "CREATE TABLE IF NOT EXISTS records ("
        "  id TEXT PRIMARY KEY,"
        "  content TEXT NOT NULL,"
        "  timestamp INTEGER NOT NULL,"
        "  record_type TEXT NOT NULL,"
        "  valence REAL NOT NULL,"
        "  entities TEXT NOT NULL,"
        "  connections TEXT NOT NULL,"
        "  source TEXT NOT NULL,"
        "  confidence REAL NOT NULL DEFAULT 1.0"
        ");"
        "CREATE TABLE IF NOT EXISTS entity_index ("
        "  entity TEXT NOT NULL,"
        "  record_id TEXT NOT NULL,"
        "  PRIMARY KEY (entity, record_id)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_records_timestamp ON records(timestamp DESC);"
        "CREATE INDEX IF NOT EXISTS idx_entity ON entity_index(entity);"
        "CREATE INDEX IF NOT EXISTS idx_entity_record ON entity_index(record_id);");
}

Record SqliteActiveStore::readRow(const SqliteStatement& stmt) {
    Record record;
    record.id = stmt.columnText(0);
    record.content = stmt.columnText(1);
    record.timestamp = FromMicros(stmt.columnInt64(2));
    record.recordType = domain::RecordTypeFromString(stmt.columnText(3));
    record.valence = static_cast<float>(stmt.columnDouble(4));
    for (const auto& e : JsonCodec::DecodeStringList(stmt.columnText(5))) {
        record.addEntity(e);
    }
    for (const auto& c : JsonCodec::DecodeStringList(stmt.columnText(6))) {
        record.addConnection(c);
    }
    try {
        record.source = JsonCodec::SourceFromJson(nlohmann::json::parse(stmt.columnText(7)));
    } catch (const nlohmann::json::exception& e) {
        throw StorageError(ErrorKind::Corrupt, "Malformed source for record " + record.id + ": " + e.what());
    }
    record.confidence = static_cast<float>(stmt.columnDouble(8));
    return record;
}

bool SqliteActiveStore::exists(const std::string& id) {
    SqliteStatement stmt(*m_db, "SELECT 1 FROM records WHERE id = ?;");
    stmt.bindText(1, id);
    return stmt.step();
}

void SqliteActiveStore::writeIndex(const Record& record) {
    SqliteStatement stmt(*m_db, "INSERT OR IGNORE INTO entity_index (entity, record_id) VALUES (?, ?);");
    for (const auto& entity : record.entities) {
        stmt.bindText(1, entity);
        stmt.bindText(2, record.id);
        stmt.step();
        stmt.reset();
    }
}

void SqliteActiveStore::dropIndex(const std::string& id) {
    SqliteStatement stmt(*m_db, "DELETE FROM entity_index WHERE record_id = ?;");
    stmt.bindText(1, id);
    stmt.step();
}

void SqliteActiveStore::insert(const Record& record) {
    m_db->transaction([&]() {
        if (exists(record.id)) {
            throw StorageError(ErrorKind::Duplicate, "Record already active: " + record.id);
        }

        SqliteStatement stmt(*m_db, std::string("INSERT INTO records (") + kColumns +
                                        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
        stmt.bindText(1, record.id);
        stmt.bindText(2, record.content);
        stmt.bindInt64(3, ToMicros(record.timestamp));
        stmt.bindText(4, domain::RecordTypeToString(record.recordType));
        stmt.bindDouble(5, record.valence);
        stmt.bindText(6, JsonCodec::EncodeStringList(record.entities));
        stmt.bindText(7, JsonCodec::EncodeStringList(record.connections));
        stmt.bindText(8, JsonCodec::EncodeSource(record.source));
        stmt.bindDouble(9, record.confidence);
        stmt.step();

        writeIndex(record);
    });
}

std::vector<Record> SqliteActiveStore::selectMany(const std::string& sqlTail, long long limit) {
    SqliteStatement stmt(*m_db, std::string("SELECT ") + kColumns + " FROM records " + sqlTail);
    stmt.bindInt64(1, limit);
    std::vector<Record> result;
    while (stmt.step()) {
        result.push_back(readRow(stmt));
    }
    return result;
}

std::vector<Record> SqliteActiveStore::queryByEntities(const std::vector<std::string>& entities, size_t limit) {
    std::vector<Record> result;
    if (entities.empty() || limit == 0) {
        return result;
    }

    std::string placeholders;
    for (size_t i = 0; i < entities.size(); ++i) {
        placeholders += (i == 0) ? "?" : ", ?";
    }

    SqliteStatement stmt(*m_db,
        std::string("SELECT ") + kColumns + " FROM records "
        "WHERE id IN (SELECT record_id FROM entity_index WHERE entity IN (" + placeholders + ")) "
        "ORDER BY timestamp DESC, rowid DESC LIMIT ?;");
    int col = 1;
    for (const auto& entity : entities) {
        stmt.bindText(col++, entity);
    }
    stmt.bindInt64(col, ToSqlLimit(limit));

    while (stmt.step()) {
        result.push_back(readRow(stmt));
    }
    return result;
}

std::vector<Record> SqliteActiveStore::recent(size_t n) {
    if (n == 0) return {};
    return selectMany("ORDER BY timestamp DESC, rowid DESC LIMIT ?;", ToSqlLimit(n));
}

std::vector<Record> SqliteActiveStore::oldest(size_t n) {
    if (n == 0) return {};
    return selectMany("ORDER BY timestamp ASC, rowid ASC LIMIT ?;", ToSqlLimit(n));
}

std::vector<Record> SqliteActiveStore::all() {
    return selectMany("ORDER BY timestamp ASC, rowid ASC LIMIT ?;", -1);
}

std::optional<Record> SqliteActiveStore::findById(const std::string& id) {
    SqliteStatement stmt(*m_db, std::string("SELECT ") + kColumns + " FROM records WHERE id = ?;");
    stmt.bindText(1, id);
    if (stmt.step()) {
        return readRow(stmt);
    }
    return std::nullopt;
}

void SqliteActiveStore::remove(const std::vector<std::string>& ids) {
    if (ids.empty()) return;
    m_db->transaction([&]() {
        SqliteStatement delRecord(*m_db, "DELETE FROM records WHERE id = ?;");
        SqliteStatement delIndex(*m_db, "DELETE FROM entity_index WHERE record_id = ?;");
        for (const auto& id : ids) {
            delIndex.bindText(1, id);
            delIndex.step();
            delIndex.reset();

            delRecord.bindText(1, id);
            delRecord.step();
            delRecord.reset();
        }
    });
}

void SqliteActiveStore::update(const Record& record) {
    m_db->transaction([&]() {
        SqliteStatement stmt(*m_db,
            "UPDATE records SET content = ?, entities = ?, connections = ?, valence = ? WHERE id = ?;");
        stmt.bindText(1, record.content);
        stmt.bindText(2, JsonCodec::EncodeStringList(record.entities));
        stmt.bindText(3, JsonCodec::EncodeStringList(record.connections));
        stmt.bindDouble(4, record.valence);
        stmt.bindText(5, record.id);
        stmt.step();

        if (sqlite3_changes(m_db->handle()) == 0) {
            throw StorageError(ErrorKind::NotFound, "No active record with id " + record.id);
        }

        dropIndex(record.id);
        writeIndex(record);
    });
}

size_t SqliteActiveStore::count() {
    SqliteStatement stmt(*m_db, "SELECT COUNT(*) FROM records;");
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<size_t>(stmt.columnInt64(0));
}

void SqliteActiveStore::transaction(const std::function<void()>& work) {
    m_db->transaction(work);
}

} // namespace engram::infrastructure
