/**
 * @file MemoryManager.hpp
 * @brief Orchestrates the active and archive tiers: insertion, eviction, recall and consolidation.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "domain/ActiveRecordRepository.hpp"
#include "domain/ArchiveRepository.hpp"
#include "domain/EngramConfig.hpp"
#include "domain/Record.hpp"
#include "domain/services/RecordSimilarity.hpp"

namespace engram::application {

/**
 * @struct ConsolidationReport
 * @brief Outcome of one consolidation pass.
 */
struct ConsolidationReport {
    size_t merged = 0;     ///< Records folded into a survivor and removed.
    size_t remaining = 0;  ///< Active records after the pass.
};

/**
 * @class MemoryManager
 * @brief Single entry point for record producers and consumers.
 *
 * Public operations are serialized by one mutex per instance.
 * Storage failures surface as domain::StorageError.
 */
class MemoryManager {
public:
    MemoryManager(std::unique_ptr<domain::ActiveRecordRepository> active,
                  std::unique_ptr<domain::ArchiveRepository> archive,
                  domain::EngramConfig config = {});

    /**
     * @brief Creates a record from text, extracting entities and linking related records.
     * Eviction failures are logged and retried on the next add; they never fail the insert.
     * @return Id of the new record.
     */
    std::string add(const std::string& content, domain::RecordType type, float valence);

    /**
     * @brief Stores a caller-built record (e.g. one with researched provenance).
     * Entities are extracted from the content when the record has none.
     * @throws domain::StorageError (Duplicate) if the id exists in either tier.
     */
    std::string addWithSource(domain::Record record);

    /**
     * @brief Best n records for the entities: active matches, then recent
     * padding, then a bounded archive search. Ranked by recency plus
     * emotional weight, highest first.
     */
    std::vector<domain::Record> recall(const std::vector<std::string>& entities, size_t n);

    /** @brief Up to 10 active records sharing an entity, newest first. */
    std::vector<domain::Record> recallByEntities(const std::vector<std::string>& entities);

    /** @brief Newest n active records. */
    std::vector<domain::Record> recallRecent(size_t n);

    /**
     * @brief Merges near-duplicate active records. No-op when nothing was added since the last pass.
     * @throws domain::StorageError if the merge transaction fails; nothing is applied.
     */
    ConsolidationReport consolidate();

    size_t count();
    size_t archivedCount();

    /** @brief Adds since the last successful consolidation. */
    size_t pendingConsolidation();

    /** @brief Counts records written to the active tier behind the manager (bulk import). */
    void markDirty(size_t added);

    const domain::EngramConfig& config() const { return m_config; }

    /** @brief Provides access to the tiers (bulk import, diagnostics). */
    domain::ActiveRecordRepository& GetActiveStore() { return *m_active; }
    domain::ArchiveRepository& GetArchiveStore() { return *m_archive; }

private:
    std::string storeLocked(domain::Record record);
    void archiveIfNeeded();
    void evictOldest(size_t batch);

    std::unique_ptr<domain::ActiveRecordRepository> m_active;
    std::unique_ptr<domain::ArchiveRepository> m_archive;
    domain::EngramConfig m_config;
    domain::services::ConnectionRule m_rule;

    std::mutex m_mutex;
    size_t m_addsSinceConsolidation = 0;
};

} // namespace engram::application
