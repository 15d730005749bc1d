/**
 * @file ArchiveStoreFs.cpp
 * @brief Implementation of ArchiveStoreFs.
 */

#include "infrastructure/ArchiveStoreFs.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/TimeUtils.hpp"
#include "domain/StorageError.hpp"
#include <iostream>

namespace engram::infrastructure {

namespace fs = std::filesystem;
using domain::ErrorKind;
using domain::Record;
using domain::StorageError;

ArchiveStoreFs::ArchiveStoreFs(fs::path archiveRoot, const std::string& indexDbPath, size_t previewLength)
    : m_root(std::move(archiveRoot)),
      m_index(std::make_unique<SqliteArchiveIndex>(indexDbPath, previewLength)) {
    fs::create_directories(m_root);
}

std::string ArchiveStoreFs::BucketKeyFor(std::chrono::system_clock::time_point timestamp) {
    return TimeUtils::FormatUtc(timestamp, "%Y-%m");
}

fs::path ArchiveStoreFs::resolve(const std::string& relativePath) const {
    fs::path rel(relativePath);
    if (rel.is_absolute()) {
        throw StorageError(ErrorKind::NotFound, "Archive path must be relative: " + relativePath);
    }
    for (const auto& part : rel) {
        if (part == "..") {
            throw StorageError(ErrorKind::NotFound, "Archive path escapes the archive root: " + relativePath);
        }
    }
    return m_root / rel;
}

std::string ArchiveStoreFs::append(const std::vector<Record>& records, const std::string& bucketKey) {
    const std::string stem = "archive_" + TimeUtils::FormatUtc(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S");
    const std::string content = JsonCodec::EncodeRecords(records);
    fs::path bucketDir = resolve(bucketKey);

    // Two batches within the same second get _0001, _0002, ... suffixes
    std::string fileName = AtomicFileWriter::writeNumbered(bucketDir, stem, content);
    std::string relative = (fs::path(bucketKey) / fileName).generic_string();
    std::cout << "[ArchiveStoreFs] Archived " << records.size() << " records to " << relative << std::endl;
    return relative;
}

std::string ArchiveStoreFs::appendNamed(const std::vector<Record>& records,
                                        const std::string& bucketKey,
                                        const std::string& fileName) {
    std::string relative = (fs::path(bucketKey) / fileName).generic_string();
    if (!AtomicFileWriter::writeNew(resolve(relative), JsonCodec::EncodeRecords(records))) {
        throw StorageError(ErrorKind::Duplicate, "Archive file already exists: " + relative);
    }
    std::cout << "[ArchiveStoreFs] Wrote " << records.size() << " records to " << relative << std::endl;
    return relative;
}

void ArchiveStoreFs::index(const Record& record, const std::string& filePath) {
    m_index->upsert(record, filePath);
}

std::vector<std::string> ArchiveStoreFs::findByEntities(const std::vector<std::string>& entities, size_t limit) {
    return m_index->findFiles(entities, limit);
}

std::vector<Record> ArchiveStoreFs::load(const std::string& filePath) {
    return JsonCodec::DecodeRecords(AtomicFileWriter::read(resolve(filePath)));
}

std::optional<domain::ArchiveIndexEntry> ArchiveStoreFs::findEntry(const std::string& id) {
    return m_index->find(id);
}

size_t ArchiveStoreFs::archivedCount() {
    return m_index->count();
}

void ArchiveStoreFs::transaction(const std::function<void()>& work) {
    m_index->transaction(work);
}

} // namespace engram::infrastructure
