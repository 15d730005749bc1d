/**
 * @file SqliteArchiveIndex.cpp
 * @brief Implementation of SqliteArchiveIndex.
 */

#include "infrastructure/SqliteArchiveIndex.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "domain/services/TextUtils.hpp"
#include <algorithm>

namespace engram::infrastructure {

using domain::ArchiveIndexEntry;
using domain::Record;

namespace {

// Matches the opening quote of a JSON string element, so "Par" finds ["Paris"]
// but not ["Comparison"].
std::string LikePattern(const std::string& entity) {
    std::string escaped;
    for (char c : entity) {
        if (c == '%' || c == '_' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return "%\"" + escaped + "%";
}

} // namespace

SqliteArchiveIndex::SqliteArchiveIndex(const std::string& dbPath, size_t previewLength)
    : m_db(std::make_unique<SqliteDatabase>(dbPath)), m_previewLength(previewLength) {
    initSchema();
}

void SqliteArchiveIndex::initSchema() {
    m_db->exec(
        "CREATE TABLE IF NOT EXISTS archive_metadata ("
        "  id TEXT PRIMARY KEY,"
        "  file_path TEXT NOT NULL,"
        "  timestamp INTEGER NOT NULL,"
        "  entities TEXT NOT NULL,"
        "  valence REAL NOT NULL,"
        "  record_type TEXT NOT NULL,"
        "  content_preview TEXT NOT NULL,"
        "  connections TEXT NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_archive_timestamp ON archive_metadata(timestamp DESC);"
        "CREATE INDEX IF NOT EXISTS idx_archive_entities ON archive_metadata(entities);");
}

void SqliteArchiveIndex::upsert(const Record& record, const std::string& filePath) {
    SqliteStatement stmt(*m_db,
        "INSERT OR REPLACE INTO archive_metadata "
        "(id, file_path, timestamp, entities, valence, record_type, content_preview, connections) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    stmt.bindText(1, record.id);
    stmt.bindText(2, filePath);
    stmt.bindInt64(3, std::chrono::duration_cast<std::chrono::microseconds>(
                          record.timestamp.time_since_epoch()).count());
    stmt.bindText(4, JsonCodec::EncodeStringList(record.entities));
    stmt.bindDouble(5, record.valence);
    stmt.bindText(6, domain::RecordTypeToString(record.recordType));
    stmt.bindText(7, domain::services::Utf8Prefix(record.content, m_previewLength));
    stmt.bindText(8, JsonCodec::EncodeStringList(record.connections));
    stmt.step();
}

std::vector<std::string> SqliteArchiveIndex::findFiles(const std::vector<std::string>& entities, size_t limit) {
    std::vector<std::string> files;
    if (limit == 0) {
        return files;
    }

    SqliteStatement stmt(*m_db,
        "SELECT file_path, MAX(timestamp) AS newest FROM archive_metadata "
        "WHERE entities LIKE ? ESCAPE '\\' "
        "GROUP BY file_path ORDER BY newest DESC LIMIT ?;");

    for (const auto& entity : entities) {
        stmt.bindText(1, LikePattern(entity));
        stmt.bindInt64(2, static_cast<long long>(limit));
        while (stmt.step()) {
            std::string path = stmt.columnText(0);
            if (std::find(files.begin(), files.end(), path) == files.end()) {
                files.push_back(path);
            }
        }
        stmt.reset();
        if (files.size() >= limit) {
            break;
        }
    }

    if (files.size() > limit) {
        files.resize(limit);
    }
    return files;
}

std::optional<ArchiveIndexEntry> SqliteArchiveIndex::find(const std::string& id) {
    SqliteStatement stmt(*m_db,
        "SELECT id, file_path, timestamp, entities, valence, record_type, content_preview, connections "
        "FROM archive_metadata WHERE id = ?;");
    stmt.bindText(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }

    ArchiveIndexEntry entry;
    entry.id = stmt.columnText(0);
    entry.filePath = stmt.columnText(1);
    entry.timestamp = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(stmt.columnInt64(2))));
    entry.entities = JsonCodec::DecodeStringList(stmt.columnText(3));
    entry.valence = static_cast<float>(stmt.columnDouble(4));
    entry.recordType = domain::RecordTypeFromString(stmt.columnText(5));
    entry.contentPreview = stmt.columnText(6);
    entry.connections = JsonCodec::DecodeStringList(stmt.columnText(7));
    return entry;
}

size_t SqliteArchiveIndex::count() {
    SqliteStatement stmt(*m_db, "SELECT COUNT(*) FROM archive_metadata;");
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<size_t>(stmt.columnInt64(0));
}

} // namespace engram::infrastructure
