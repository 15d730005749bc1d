/**
 * @file LegacyMigrator.cpp
 * @brief Implementation of LegacyMigrator.
 */

#include "application/LegacyMigrator.hpp"
#include "domain/StorageError.hpp"
#include "infrastructure/ArchiveStoreFs.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <nlohmann/json.hpp>

namespace engram::application {

using domain::ErrorKind;
using domain::Record;
using domain::StorageError;
using json = nlohmann::json;

namespace {

Record FromLegacy(const json& item) {
    Record record;
    record.id = item.at("id").get<std::string>();
    record.content = item.at("content").get<std::string>();

    auto parsed = infrastructure::TimeUtils::ParseIso8601(item.at("timestamp").get<std::string>());
    if (!parsed) {
        throw StorageError(ErrorKind::Corrupt, "Malformed timestamp on legacy record " + record.id);
    }
    record.timestamp = *parsed;

    for (const auto& e : item.value("entities", std::vector<std::string>{})) {
        record.addEntity(e);
    }
    for (const auto& c : item.value("connections", std::vector<std::string>{})) {
        record.addConnection(c);
    }
    record.recordType = domain::RecordTypeFromString(item.value("memory_type", "Interaction"));
    record.valence = std::clamp(item.value("emotional_valence", 0.0f), -1.0f, 1.0f);
    return record;
}

} // namespace

LegacyMigrator::LegacyMigrator(MemoryManager& manager) : m_manager(manager) {}

MigrationReport LegacyMigrator::migrateFile(const std::string& path) {
    std::cout << "[LegacyMigrator] Reading legacy file: " << path << std::endl;
    return migrate(infrastructure::AtomicFileWriter::read(path));
}

MigrationReport LegacyMigrator::migrate(const std::string& jsonText) {
    std::vector<Record> records;
    try {
        json root = json::parse(jsonText);
        for (const auto& item : root.at("memories")) {
            records.push_back(FromLegacy(item));
        }
    } catch (const json::exception& e) {
        throw StorageError(ErrorKind::Corrupt, std::string("Malformed legacy stream: ") + e.what());
    }

    MigrationReport report;
    auto& active = m_manager.GetActiveStore();
    auto& archive = m_manager.GetArchiveStore();

    // Skip repeated ids and anything already present in either tier
    std::vector<Record> fresh;
    std::set<std::string> seen;
    for (auto& record : records) {
        if (!seen.insert(record.id).second || active.findById(record.id) || archive.findEntry(record.id)) {
            ++report.skipped;
            continue;
        }
        fresh.push_back(std::move(record));
    }

    std::stable_sort(fresh.begin(), fresh.end(), [](const Record& a, const Record& b) {
        return a.timestamp > b.timestamp;
    });

    const size_t room = active.count() < m_manager.config().activeLimit
                            ? m_manager.config().activeLimit - active.count()
                            : 0;
    const size_t split = std::min(room, fresh.size());

    active.transaction([&]() {
        for (size_t i = 0; i < split; ++i) {
            active.insert(fresh[i]);
        }
    });
    report.active = split;
    m_manager.markDirty(split);

    std::map<std::string, std::vector<Record>> byMonth;
    for (size_t i = split; i < fresh.size(); ++i) {
        byMonth[infrastructure::ArchiveStoreFs::BucketKeyFor(fresh[i].timestamp)].push_back(fresh[i]);
    }

    for (const auto& [month, monthRecords] : byMonth) {
        std::string filePath;
        try {
            filePath = archive.appendNamed(monthRecords, month, "migrated_archive.json");
        } catch (const StorageError& e) {
            if (e.kind() != ErrorKind::Duplicate) throw;
            // An earlier import already used the fixed name for this month
            filePath = archive.append(monthRecords, month);
        }
        archive.transaction([&]() {
            for (const auto& record : monthRecords) {
                archive.index(record, filePath);
            }
        });
        report.archived += monthRecords.size();
    }

    std::cout << "[LegacyMigrator] Migration complete: " << report.active << " active, "
              << report.archived << " archived, " << report.skipped << " skipped" << std::endl;
    return report;
}

} // namespace engram::application
