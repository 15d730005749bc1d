/**
 * @file MemoryManager.cpp
 * @brief Implementation of MemoryManager.
 */

#include "application/MemoryManager.hpp"
#include "domain/StorageError.hpp"
#include "domain/services/EntityExtractor.hpp"
#include "domain/services/TextUtils.hpp"
#include "infrastructure/ArchiveStoreFs.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <set>
#include <unordered_set>

namespace engram::application {

using domain::ErrorKind;
using domain::Record;
using domain::StorageError;
using domain::services::EntityExtractor;
using domain::services::RecordSimilarity;

namespace {

double RecallScore(const Record& record) {
    return static_cast<double>(record.unixSeconds()) + std::fabs(record.valence) * 1000.0;
}

} // namespace

MemoryManager::MemoryManager(std::unique_ptr<domain::ActiveRecordRepository> active,
                             std::unique_ptr<domain::ArchiveRepository> archive,
                             domain::EngramConfig config)
    : m_active(std::move(active)), m_archive(std::move(archive)), m_config(config) {
    m_config.validate();
    m_rule.strongOverlap = m_config.connectionThreshold;
    m_rule.weakOverlap = m_config.weakConnectionThreshold;
    m_rule.valenceProximity = m_config.valenceProximity;
}

std::string MemoryManager::add(const std::string& content, domain::RecordType type, float valence) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Record record = Record::Create(content, EntityExtractor::Extract(content), type, valence);
    return storeLocked(std::move(record));
}

std::string MemoryManager::addWithSource(Record record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (record.id.empty()) {
        record.id = Record::GenerateId();
    }
    if (m_active->findById(record.id) || m_archive->findEntry(record.id)) {
        throw StorageError(ErrorKind::Duplicate, "Record id already stored: " + record.id);
    }
    if (record.entities.empty()) {
        for (const auto& entity : EntityExtractor::Extract(record.content)) {
            record.addEntity(entity);
        }
    }
    record.valence = std::clamp(record.valence, -1.0f, 1.0f);
    record.confidence = std::clamp(record.confidence, 0.0f, 1.0f);
    return storeLocked(std::move(record));
}

std::string MemoryManager::storeLocked(Record record) {
    RecordSimilarity::buildConnections(record, m_active->all(), m_rule);
    m_active->insert(record);
    ++m_addsSinceConsolidation;

    archiveIfNeeded();
    return record.id;
}

void MemoryManager::archiveIfNeeded() {
    // The new record is already stored; a failed eviction is retried on the next add
    try {
        while (m_active->count() > m_config.activeLimit) {
            evictOldest(m_config.evictionBatch);
        }
    } catch (const StorageError& e) {
        std::cerr << "[MemoryManager] Eviction deferred: " << e.what() << std::endl;
    }
}

void MemoryManager::evictOldest(size_t batch) {
    auto oldest = m_active->oldest(batch);
    if (oldest.empty()) {
        return;
    }

    std::map<std::string, std::vector<Record>> byBucket;
    for (auto& record : oldest) {
        byBucket[infrastructure::ArchiveStoreFs::BucketKeyFor(record.timestamp)].push_back(std::move(record));
    }

    // Index rows commit only together with the removal from the active tier.
    // A file left behind by a rolled-back bucket has no index rows and is never read.
    for (const auto& [bucket, records] : byBucket) {
        std::string filePath = m_archive->append(records, bucket);
        std::vector<std::string> ids;
        ids.reserve(records.size());
        m_archive->transaction([&]() {
            for (const auto& record : records) {
                m_archive->index(record, filePath);
                ids.push_back(record.id);
            }
            m_active->remove(ids);
        });
    }

    std::cout << "[MemoryManager] Archived " << oldest.size() << " oldest records into "
              << byBucket.size() << " bucket(s)" << std::endl;
}

std::vector<Record> MemoryManager::recall(const std::vector<std::string>& entities, size_t n) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Record> results;
    if (n == 0) {
        return results;
    }

    std::unordered_set<std::string> seen;
    auto collect = [&](std::vector<Record>&& batch) {
        for (auto& record : batch) {
            if (seen.insert(record.id).second) {
                results.push_back(std::move(record));
            }
        }
    };

    // 1. Active entity matches
    if (!entities.empty()) {
        try {
            collect(m_active->queryByEntities(entities, n));
        } catch (const StorageError& e) {
            std::cerr << "[MemoryManager] Entity lookup failed: " << e.what() << std::endl;
        }
    }

    // 2. Pad with recent records
    if (results.size() < n) {
        try {
            collect(m_active->recent(n - results.size()));
        } catch (const StorageError& e) {
            std::cerr << "[MemoryManager] Recent lookup failed: " << e.what() << std::endl;
        }
    }

    // 3. Archive files matching the entities
    if (results.size() < n && !entities.empty()) {
        std::vector<std::string> files;
        try {
            files = m_archive->findByEntities(entities, m_config.archiveLookupFiles);
        } catch (const StorageError& e) {
            std::cerr << "[MemoryManager] Archive index lookup failed: " << e.what() << std::endl;
        }
        for (const auto& file : files) {
            try {
                collect(m_archive->load(file));
            } catch (const StorageError& e) {
                std::cerr << "[MemoryManager] Skipping archive file " << file << ": " << e.what() << std::endl;
            }
            if (results.size() >= n) {
                break;
            }
        }
    }

    std::stable_sort(results.begin(), results.end(), [](const Record& a, const Record& b) {
        return RecallScore(a) > RecallScore(b);
    });
    if (results.size() > n) {
        results.resize(n);
    }
    return results;
}

std::vector<Record> MemoryManager::recallByEntities(const std::vector<std::string>& entities) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active->queryByEntities(entities, 10);
}

std::vector<Record> MemoryManager::recallRecent(size_t n) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active->recent(n);
}

ConsolidationReport MemoryManager::consolidate() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ConsolidationReport report;

    if (m_addsSinceConsolidation == 0) {
        report.remaining = m_active->count();
        return report;
    }

    std::vector<Record> records = m_active->all();

    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < records.size(); ++i) {
        for (size_t j = i + 1; j < records.size(); ++j) {
            if (RecordSimilarity::shouldMerge(records[i], records[j], m_config.mergeThreshold)) {
                pairs.emplace_back(i, j);
            }
        }
    }

    // Highest loser index first, so a loser that absorbed later records is folded in whole
    std::sort(pairs.begin(), pairs.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first > b.first;
    });

    std::vector<bool> retired(records.size(), false);
    std::set<size_t> modified;
    std::vector<std::string> retiredIds;

    for (const auto& [i, j] : pairs) {
        if (retired[i] || retired[j]) {
            continue;
        }
        Record& survivor = records[i];
        const Record& loser = records[j];

        survivor.content += "\n\n[Merged record from " +
                            infrastructure::TimeUtils::FormatUtc(loser.timestamp, "%Y-%m-%d %H:%M") + "]: " +
                            domain::services::Utf8Prefix(loser.content, m_config.mergeExcerptLength);
        for (const auto& entity : loser.entities) {
            survivor.addEntity(entity);
        }
        for (const auto& connection : loser.connections) {
            survivor.addConnection(connection);
        }
        survivor.valence = (survivor.valence + loser.valence) / 2.0f;

        retired[j] = true;
        retiredIds.push_back(loser.id);
        modified.insert(i);
    }

    if (retiredIds.empty()) {
        m_addsSinceConsolidation = 0;
        report.remaining = records.size();
        std::cout << "[MemoryManager] Consolidation found nothing to merge" << std::endl;
        return report;
    }

    std::unordered_set<std::string> retiredSet(retiredIds.begin(), retiredIds.end());
    for (size_t index : modified) {
        auto& connections = records[index].connections;
        connections.erase(std::remove_if(connections.begin(), connections.end(),
                                         [&](const std::string& id) {
                                             return retiredSet.count(id) > 0 || id == records[index].id;
                                         }),
                          connections.end());
    }

    try {
        m_active->transaction([&]() {
            m_active->remove(retiredIds);
            for (size_t index : modified) {
                if (!retired[index]) {
                    m_active->update(records[index]);
                }
            }
        });
    } catch (const StorageError& e) {
        std::cerr << "[MemoryManager] Consolidation rolled back: " << e.what() << std::endl;
        throw StorageError(e.kind(), std::string("Consolidation aborted: ") + e.what());
    }

    m_addsSinceConsolidation = 0;
    report.merged = retiredIds.size();
    report.remaining = m_active->count();
    std::cout << "[MemoryManager] Consolidation complete: " << report.merged << " merged, "
              << report.remaining << " active" << std::endl;
    return report;
}

size_t MemoryManager::count() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active->count();
}

size_t MemoryManager::archivedCount() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_archive->archivedCount();
}

size_t MemoryManager::pendingConsolidation() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_addsSinceConsolidation;
}

void MemoryManager::markDirty(size_t added) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_addsSinceConsolidation += added;
}

} // namespace engram::application
