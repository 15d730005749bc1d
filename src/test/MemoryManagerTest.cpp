#include <algorithm>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>

#include "application/LegacyMigrator.hpp"
#include "application/MemoryManager.hpp"
#include "domain/StorageError.hpp"
#include "infrastructure/ArchiveStoreFs.hpp"
#include "infrastructure/SqliteActiveStore.hpp"

using namespace engram::domain;
using namespace engram::application;
using namespace engram::infrastructure;
namespace fs = std::filesystem;

// Active store whose update() or remove() fails on demand
class FlakyActiveStore : public ActiveRecordRepository {
public:
    explicit FlakyActiveStore(const std::string& path) : m_inner(path) {}

    bool failUpdates = false;
    bool failRemoves = false;

    void insert(const Record& record) override { m_inner.insert(record); }
    std::vector<Record> queryByEntities(const std::vector<std::string>& entities, size_t limit) override {
        return m_inner.queryByEntities(entities, limit);
    }
    std::vector<Record> recent(size_t n) override { return m_inner.recent(n); }
    std::vector<Record> oldest(size_t n) override { return m_inner.oldest(n); }
    std::vector<Record> all() override { return m_inner.all(); }
    std::optional<Record> findById(const std::string& id) override { return m_inner.findById(id); }
    void remove(const std::vector<std::string>& ids) override {
        if (failRemoves) {
            throw StorageError(ErrorKind::IOFailure, "simulated disk failure");
        }
        m_inner.remove(ids);
    }
    void update(const Record& record) override {
        if (failUpdates) {
            throw StorageError(ErrorKind::IOFailure, "simulated disk failure");
        }
        m_inner.update(record);
    }
    size_t count() override { return m_inner.count(); }
    void transaction(const std::function<void()>& work) override { m_inner.transaction(work); }

private:
    SqliteActiveStore m_inner;
};

// Archive whose index() fails once a given number of rows were written
class FlakyArchiveStore : public ArchiveRepository {
public:
    FlakyArchiveStore(const fs::path& root, const std::string& indexPath, size_t previewLength)
        : m_inner(root, indexPath, previewLength) {}

    int failIndexAfter = -1;  ///< Successful index() calls allowed; -1 never fails.

    std::string append(const std::vector<Record>& records, const std::string& bucketKey) override {
        return m_inner.append(records, bucketKey);
    }
    std::string appendNamed(const std::vector<Record>& records, const std::string& bucketKey,
                            const std::string& fileName) override {
        return m_inner.appendNamed(records, bucketKey, fileName);
    }
    void index(const Record& record, const std::string& filePath) override {
        if (failIndexAfter == 0) {
            throw StorageError(ErrorKind::IOFailure, "simulated index failure");
        }
        if (failIndexAfter > 0) --failIndexAfter;
        m_inner.index(record, filePath);
    }
    std::vector<std::string> findByEntities(const std::vector<std::string>& entities, size_t limit) override {
        return m_inner.findByEntities(entities, limit);
    }
    std::vector<Record> load(const std::string& filePath) override { return m_inner.load(filePath); }
    std::optional<ArchiveIndexEntry> findEntry(const std::string& id) override { return m_inner.findEntry(id); }
    size_t archivedCount() override { return m_inner.archivedCount(); }
    void transaction(const std::function<void()>& work) override { m_inner.transaction(work); }

private:
    ArchiveStoreFs m_inner;
};

namespace {

std::unique_ptr<MemoryManager> OpenManager(const fs::path& root, const EngramConfig& config,
                                           FlakyActiveStore** flaky = nullptr,
                                           FlakyArchiveStore** flakyArchive = nullptr) {
    auto active = std::make_unique<FlakyActiveStore>((root / "active_memory.db").string());
    if (flaky) *flaky = active.get();
    auto archive = std::make_unique<FlakyArchiveStore>(root / "archive", (root / "archive_index.db").string(),
                                                       config.previewLength);
    if (flakyArchive) *flakyArchive = archive.get();
    return std::make_unique<MemoryManager>(std::move(active), std::move(archive), config);
}

// Every id lives in exactly one tier
void AssertSingleTier(MemoryManager& manager, const std::vector<std::string>& ids) {
    for (const auto& id : ids) {
        bool inActive = manager.GetActiveStore().findById(id).has_value();
        bool inArchive = manager.GetArchiveStore().findEntry(id).has_value();
        assert(inActive != inArchive && "Record must live in exactly one tier.");
    }
}

Record WithEntities(const std::string& content, std::vector<std::string> entities, float valence) {
    return Record::Create(content, std::move(entities), RecordType::Interaction, valence);
}

void TestCountAndRecent(const fs::path& root) {
    std::cout << "[Test] count / recent..." << std::endl;
    auto manager = OpenManager(root / "count", EngramConfig{});

    std::vector<std::string> ids;
    for (int i = 0; i < 25; ++i) {
        ids.push_back(manager->add("plain note number " + std::to_string(i), RecordType::Interaction, 0.0f));
    }
    assert(manager->count() == ids.size());

    auto recent = manager->recallRecent(manager->count());
    std::set<std::string> recentIds;
    for (const auto& r : recent) recentIds.insert(r.id);
    for (const auto& id : ids) {
        assert(recentIds.count(id) == 1 && "Every added id is retrievable.");
    }
    assert(recent.front().id == ids.back());
    std::cout << "[PASS] count / recent." << std::endl;
}

void TestEviction(const fs::path& root) {
    std::cout << "[Test] Eviction of the oldest batch..." << std::endl;
    EngramConfig config;
    auto manager = OpenManager(root / "evict", config);

    std::vector<std::string> ids;
    for (size_t i = 0; i < config.activeLimit + config.evictionBatch; ++i) {
        ids.push_back(manager->add("entry " + std::to_string(i), RecordType::Interaction, 0.1f));
    }

    assert(manager->count() == config.activeLimit);
    assert(manager->archivedCount() == config.evictionBatch);

    auto& active = manager->GetActiveStore();
    auto& archive = manager->GetArchiveStore();
    for (size_t i = 0; i < ids.size(); ++i) {
        bool inActive = active.findById(ids[i]).has_value();
        bool inArchive = archive.findEntry(ids[i]).has_value();
        if (i < config.evictionBatch) {
            assert(!inActive && inArchive && "Oldest records move to the archive.");
        } else {
            assert(inActive && !inArchive && "Newer records stay active.");
        }
    }

    auto entry = archive.findEntry(ids[0]);
    auto archived = archive.load(entry->filePath);
    assert(!archived.empty() && archived.size() <= config.evictionBatch);
    assert(entry->filePath.rfind(ArchiveStoreFs::BucketKeyFor(archived.front().timestamp) + "/", 0) == 0);

    bool duplicate = false;
    try {
        manager->addWithSource(archived.front());
    } catch (const StorageError& e) {
        duplicate = e.kind() == ErrorKind::Duplicate;
    }
    assert(duplicate && "Archived ids cannot be re-added.");
    std::cout << "[PASS] Eviction." << std::endl;
}

void TestEvictionFailure(const fs::path& root) {
    std::cout << "[Test] Eviction failure..." << std::endl;
    EngramConfig config;
    config.activeLimit = 4;
    config.evictionBatch = 3;
    FlakyActiveStore* flaky = nullptr;
    FlakyArchiveStore* flakyArchive = nullptr;
    auto manager = OpenManager(root / "evict_fail", config, &flaky, &flakyArchive);

    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(manager->add("steady note " + std::to_string(i), RecordType::Interaction, 0.0f));
    }

    // Index fails on the second row of the batch: the add still succeeds, nothing moves
    flakyArchive->failIndexAfter = 1;
    std::string overflow = manager->add("overflow note", RecordType::Interaction, 0.0f);
    ids.push_back(overflow);
    assert(manager->GetActiveStore().findById(overflow) && "The new record is stored.");
    assert(manager->count() == 5);
    assert(manager->archivedCount() == 0 && "Partial index rows are rolled back.");
    AssertSingleTier(*manager, ids);

    // Removal from the active tier fails: index rows are rolled back too
    flakyArchive->failIndexAfter = -1;
    flaky->failRemoves = true;
    ids.push_back(manager->add("second overflow", RecordType::Interaction, 0.0f));
    assert(manager->count() == 6);
    assert(manager->archivedCount() == 0);
    AssertSingleTier(*manager, ids);

    // Storage recovers: the next add catches up
    flaky->failRemoves = false;
    ids.push_back(manager->add("third overflow", RecordType::Interaction, 0.0f));
    assert(manager->count() <= config.activeLimit);
    assert(manager->count() + manager->archivedCount() == ids.size());
    AssertSingleTier(*manager, ids);
    assert(manager->GetArchiveStore().findEntry(ids[0]) && "Oldest records were archived.");
    std::cout << "[PASS] Eviction failure." << std::endl;
}

void TestLongContent(const fs::path& root) {
    std::cout << "[Test] Long content..." << std::endl;
    auto manager = OpenManager(root / "long", EngramConfig{});

    std::string quoted(60000, 'x');
    std::string id = manager->add("Notes: \"" + quoted + "\"", RecordType::Interaction, 0.0f);
    auto stored = manager->GetActiveStore().findById(id);
    assert(stored && stored->hasEntity("Notes") && stored->hasEntity(quoted));

    std::string phrase;
    for (int i = 0; i < 12000; ++i) phrase += "Word ";
    manager->add(phrase, RecordType::Interaction, 0.0f);
    assert(manager->count() == 2);
    std::cout << "[PASS] Long content." << std::endl;
}

void TestConsolidation(const fs::path& root) {
    std::cout << "[Test] Consolidation..." << std::endl;
    auto manager = OpenManager(root / "consolidate", EngramConfig{});

    Record a = WithEntities("Walked along the Seine", {"Paris", "Seine", "Louvre"}, 0.8f);
    Record b = WithEntities("Museum day", {"Paris", "Seine", "Louvre", "Orsay"}, 0.2f);
    Record c = WithEntities("Unrelated thought", {"Berlin"}, -0.4f);
    manager->addWithSource(a);
    manager->addWithSource(b);
    manager->addWithSource(c);
    assert(manager->pendingConsolidation() == 3);

    auto report = manager->consolidate();
    assert(report.merged == 1);
    assert(report.remaining == 2);
    assert(manager->pendingConsolidation() == 0);

    auto survivor = manager->GetActiveStore().findById(a.id);
    assert(survivor && "Earlier record survives.");
    assert(!manager->GetActiveStore().findById(b.id) && "Later record is retired.");
    assert(std::fabs(survivor->valence - 0.5f) < 1e-5f && "Valence is the mean of both.");
    assert(survivor->entities.size() == 4 && survivor->hasEntity("Orsay") && "Entities are unioned.");
    assert(survivor->content.find("Walked along the Seine") == 0);
    assert(survivor->content.find("[Merged record from ") != std::string::npos);
    assert(survivor->content.find("Museum day") != std::string::npos);
    assert(!survivor->isConnectedTo(b.id) && !survivor->isConnectedTo(a.id));

    // Second run without adds is a no-op
    auto again = manager->consolidate();
    assert(again.merged == 0 && again.remaining == 2);
    assert(manager->count() == 2);
    std::cout << "[PASS] Consolidation." << std::endl;
}

void TestParisScenario(const fs::path& root) {
    std::cout << "[Test] Paris / France scenario..." << std::endl;
    auto manager = OpenManager(root / "paris", EngramConfig{});

    Record a = WithEntities("A", {"Paris"}, 0.2f);
    Record b = WithEntities("B", {"Paris", "France"}, 0.6f);
    manager->addWithSource(a);
    manager->addWithSource(b);
    auto first = manager->consolidate();
    assert(first.merged == 0 && first.remaining == 2 && "Ratio 0.5 does not merge.");

    Record c = WithEntities("C", {"Paris"}, 0.3f);
    manager->addWithSource(c);
    auto second = manager->consolidate();
    assert(second.merged == 1 && second.remaining == 2);

    auto merged = manager->GetActiveStore().findById(a.id);
    assert(merged);
    assert(std::fabs(merged->valence - 0.25f) < 1e-5f);
    assert(manager->GetActiveStore().findById(b.id));
    assert(!manager->GetActiveStore().findById(c.id));
    std::cout << "[PASS] Paris / France scenario." << std::endl;
}

void TestConnections(const fs::path& root) {
    std::cout << "[Test] Connections at insertion..." << std::endl;
    auto manager = OpenManager(root / "connect", EngramConfig{});

    std::string rome = manager->add("Rome was warm", RecordType::Reflection, 0.5f);
    std::string strong = manager->add("Rome again", RecordType::Reflection, -0.9f);
    std::string weak = manager->add("Rome and Milan", RecordType::Reflection, 0.4f);
    std::string far = manager->add("Rome and Milan and Turin", RecordType::Reflection, -0.9f);

    auto& active = manager->GetActiveStore();
    assert(active.findById(strong)->isConnectedTo(rome) && "Full overlap connects regardless of valence.");
    assert(active.findById(weak)->isConnectedTo(rome) && "Half overlap with close valence connects.");
    assert(!active.findById(far)->isConnectedTo(rome) && "1/3 overlap with distant valence does not.");
    assert(active.findById(far)->isConnectedTo(strong) && "1/3 overlap with equal valence connects.");
    std::cout << "[PASS] Connections." << std::endl;
}

void TestConsolidationRollback(const fs::path& root) {
    std::cout << "[Test] Consolidation rollback..." << std::endl;
    FlakyActiveStore* flaky = nullptr;
    auto manager = OpenManager(root / "rollback", EngramConfig{}, &flaky);

    Record a = WithEntities("first", {"Oslo", "Bergen"}, 0.1f);
    Record b = WithEntities("second", {"Oslo", "Bergen"}, 0.3f);
    manager->addWithSource(a);
    manager->addWithSource(b);

    flaky->failUpdates = true;
    bool failed = false;
    try {
        manager->consolidate();
    } catch (const StorageError& e) {
        failed = e.kind() == ErrorKind::IOFailure;
    }
    assert(failed && "Storage failure surfaces as one error.");
    assert(manager->count() == 2 && "Nothing was deleted.");
    assert(manager->GetActiveStore().findById(b.id));
    assert(manager->GetActiveStore().findById(a.id)->content == "first");
    assert(manager->pendingConsolidation() == 2 && "Dirty counter stays set.");

    flaky->failUpdates = false;
    auto report = manager->consolidate();
    assert(report.merged == 1 && report.remaining == 1);
    std::cout << "[PASS] Consolidation rollback." << std::endl;
}

void TestRecall(const fs::path& root) {
    std::cout << "[Test] Recall across tiers..." << std::endl;
    EngramConfig config;
    config.activeLimit = 4;
    config.evictionBatch = 2;
    fs::path dir = root / "recall";
    auto manager = OpenManager(dir, config);

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(manager->addWithSource(
            WithEntities("Tokyo diary " + std::to_string(i), {"Tokyo"}, i == 1 ? 1.0f : 0.0f)));
    }
    manager->add("nothing special here", RecordType::Interaction, 0.0f);
    // The 5th add overflows the limit and evicts the two oldest; the 6th brings it back to 4
    assert(manager->count() == 4);
    assert(manager->archivedCount() == 2);

    auto results = manager->recall({"Tokyo"}, 10);
    std::set<std::string> found;
    for (const auto& r : results) found.insert(r.id);
    assert(found.size() == results.size() && "No duplicates across stages.");
    for (const auto& id : ids) {
        assert(found.count(id) == 1 && "Archived matches are recalled.");
    }
    assert(results.size() == 6);
    assert(results.front().id == ids[1] && "Strong valence outranks recency within the bias window.");

    auto limited = manager->recall({"Tokyo"}, 2);
    assert(limited.size() == 2);
    assert(manager->recall({"Tokyo"}, 0).empty());

    // A corrupt archive file degrades recall without failing it
    auto entry = manager->GetArchiveStore().findEntry(ids[0]);
    assert(entry);
    {
        std::ofstream corrupt(dir / "archive" / entry->filePath, std::ios::trunc);
        corrupt << "{ definitely not an archive";
    }
    auto degraded = manager->recall({"Tokyo"}, 10);
    assert(degraded.size() == 4);
    for (const auto& r : degraded) {
        assert(r.id != ids[0] && r.id != ids[1]);
    }

    assert(manager->recallByEntities({"Tokyo"}).size() == 3);
    assert(manager->recallRecent(2).size() == 2);
    std::cout << "[PASS] Recall." << std::endl;
}

void TestProvenance(const fs::path& root) {
    std::cout << "[Test] Provenance survival..." << std::endl;
    EngramConfig config;
    config.activeLimit = 2;
    config.evictionBatch = 1;
    auto manager = OpenManager(root / "provenance", config);

    Researched source;
    source.origin = "encyclopedia";
    source.originalQuery = "tallest mountain";
    source.timestamp = std::chrono::system_clock::now();
    Record researched = Record::Create("Everest is the tallest mountain", {}, RecordType::Curiosity, 0.3f,
                                       source, 0.8f);
    std::string id = manager->addWithSource(researched);

    auto stored = manager->GetActiveStore().findById(id);
    assert(stored && stored->isResearched());
    assert(stored->hasEntity("Everest") && "Missing entities are extracted from content.");
    assert(std::get<Researched>(stored->source).origin == "encyclopedia");
    assert(std::fabs(stored->confidence - 0.8f) < 1e-6f);

    manager->add("later note one", RecordType::Interaction, 0.0f);
    manager->add("later note two", RecordType::Interaction, 0.0f);

    auto entry = manager->GetArchiveStore().findEntry(id);
    assert(entry && "Researched record was evicted.");
    auto archived = manager->GetArchiveStore().load(entry->filePath);
    auto it = std::find_if(archived.begin(), archived.end(), [&](const Record& r) { return r.id == id; });
    assert(it != archived.end());
    assert(it->isResearched());
    const auto& archivedSource = std::get<Researched>(it->source);
    assert(archivedSource.origin == "encyclopedia");
    assert(archivedSource.originalQuery == "tallest mountain");
    assert(std::fabs(it->confidence - 0.8f) < 1e-6f);
    std::cout << "[PASS] Provenance." << std::endl;
}

void TestLegacyMigration(const fs::path& root) {
    std::cout << "[Test] Legacy migration..." << std::endl;
    EngramConfig config;
    config.activeLimit = 2;
    config.evictionBatch = 1;
    fs::path dir = root / "migrate";
    auto manager = OpenManager(dir, config);

    const std::string legacy = R"({
        "memories": [
            {"id": "m-jan", "content": "January thoughts", "timestamp": "2024-01-10T08:00:00Z",
             "entities": ["Winter"], "connections": [], "memory_type": "Reflection", "emotional_valence": -0.2},
            {"id": "m-feb", "content": "February thoughts", "timestamp": "2024-02-15T09:30:00.123456789Z",
             "entities": ["Winter", "Snow"], "connections": ["m-jan"], "memory_type": "Curiosity", "emotional_valence": 0.4},
            {"id": "m-mar", "content": "March thoughts", "timestamp": "2024-03-20T18:45:00+00:00",
             "entities": ["Spring"], "connections": [], "memory_type": "SomethingNew", "emotional_valence": 2.0}
        ]
    })";

    LegacyMigrator migrator(*manager);
    auto report = migrator.migrate(legacy);
    assert(report.active == 2 && report.archived == 1 && report.skipped == 0);
    assert(manager->count() == 2);
    assert(manager->pendingConsolidation() == 2 && "Imported records are due for consolidation.");

    auto& active = manager->GetActiveStore();
    assert(active.findById("m-mar") && active.findById("m-feb") && !active.findById("m-jan"));
    auto march = active.findById("m-mar");
    assert(march->recordType == RecordType::Interaction && "Unknown types decode to Interaction.");
    assert(march->valence == 1.0f && "Valence is clamped.");
    assert(active.findById("m-feb")->isConnectedTo("m-jan"));

    auto entry = manager->GetArchiveStore().findEntry("m-jan");
    assert(entry && entry->filePath == "2024-01/migrated_archive.json");
    assert(fs::exists(dir / "archive" / "2024-01" / "migrated_archive.json"));
    assert(manager->recall({"Winter"}, 5).size() == 3);

    auto rerun = migrator.migrate(legacy);
    assert(rerun.active == 0 && rerun.archived == 0 && rerun.skipped == 3);
    assert(manager->pendingConsolidation() == 2);

    bool corrupt = false;
    try {
        migrator.migrate("{\"memories\": 42}");
    } catch (const StorageError& e) {
        corrupt = e.kind() == ErrorKind::Corrupt;
    }
    assert(corrupt);
    std::cout << "[PASS] Legacy migration." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting MemoryManager Test..." << std::endl;

    fs::path testRoot = "test_engram_memory_manager";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    TestCountAndRecent(testRoot);
    TestEviction(testRoot);
    TestEvictionFailure(testRoot);
    TestLongContent(testRoot);
    TestConsolidation(testRoot);
    TestParisScenario(testRoot);
    TestConnections(testRoot);
    TestConsolidationRollback(testRoot);
    TestRecall(testRoot);
    TestProvenance(testRoot);
    TestLegacyMigration(testRoot);

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
