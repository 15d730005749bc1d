#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "domain/StorageError.hpp"
#include "infrastructure/ArchiveStoreFs.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/TimeUtils.hpp"

using namespace engram::domain;
using namespace engram::infrastructure;
namespace fs = std::filesystem;

namespace {

Record MakeRecord(const std::string& content, std::vector<std::string> entities) {
    return Record::Create(content, std::move(entities), RecordType::Interaction, 0.4f);
}

ErrorKind LoadErrorKind(ArchiveStoreFs& store, const std::string& path) {
    try {
        store.load(path);
    } catch (const StorageError& e) {
        return e.kind();
    }
    assert(false && "load() should have failed.");
    return ErrorKind::IOFailure;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArchiveStore Test..." << std::endl;

    std::string testRoot = "test_engram_archive_store";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    {
        ArchiveStoreFs store(fs::path(testRoot) / "archive", testRoot + "/archive_index.db", 200);

        // Bucket keys are UTC months
        auto march = TimeUtils::ParseIso8601("2024-03-31T23:59:59Z");
        assert(march);
        assert(ArchiveStoreFs::BucketKeyFor(*march) == "2024-03");
        auto april = TimeUtils::ParseIso8601("2024-04-01T00:00:00.250000Z");
        assert(april && ArchiveStoreFs::BucketKeyFor(*april) == "2024-04");
        std::cout << "[PASS] Bucket keys." << std::endl;

        // Every append produces a new file; nothing is overwritten
        Record kyotoA = MakeRecord("Temple visit", {"Kyoto", "Osaka"});
        Record kyotoB = MakeRecord("Rainy afternoon", {"Kyoto"});
        Record osaka = MakeRecord("Street food", {"Osaka"});
        std::string first = store.append({kyotoA, kyotoB}, "2024-03");
        std::string second = store.append({osaka}, "2024-03");
        assert(first != second && "Appends in the same second must not collide.");
        assert(first.rfind("2024-03/archive_", 0) == 0);
        assert(fs::exists(store.root() / first));
        assert(fs::exists(store.root() / second));
        assert(store.load(first).size() == 2);
        assert(store.load(second).size() == 1);

        std::string named = store.appendNamed({osaka}, "2024-02", "migrated_archive.json");
        assert(named == "2024-02/migrated_archive.json");
        bool refused = false;
        try {
            store.appendNamed({kyotoA}, "2024-02", "migrated_archive.json");
        } catch (const StorageError& e) {
            refused = e.kind() == ErrorKind::Duplicate;
        }
        assert(refused && "A named archive file is written once.");
        assert(store.load(named).front().id == osaka.id);
        std::cout << "[PASS] Write-once files." << std::endl;

        // Loaded records keep every field
        auto loaded = store.load(first);
        assert(loaded[0].id == kyotoA.id);
        assert(loaded[0].content == "Temple visit");
        assert(loaded[0].entities.size() == 2);
        assert(loaded[0].valence == 0.4f);
        std::cout << "[PASS] Load." << std::endl;

        // Index: one row per id, re-indexing replaces
        store.index(kyotoA, first);
        store.index(kyotoB, first);
        store.index(osaka, named);
        store.index(osaka, second);
        assert(store.archivedCount() == 3);
        auto entry = store.findEntry(osaka.id);
        assert(entry && entry->filePath == second);
        assert(!store.findEntry("unknown"));
        std::cout << "[PASS] Index overwrite." << std::endl;

        // Previews are bounded
        Record longRecord = MakeRecord(std::string(300, 'x'), {"Nara"});
        store.index(longRecord, first);
        assert(store.findEntry(longRecord.id)->contentPreview.size() == 200);
        std::cout << "[PASS] Preview length." << std::endl;

        // Entity lookup: deduplicated and capped
        auto files = store.findByEntities({"Kyoto", "Osaka"}, 10);
        assert(files.size() == 2 && "first holds Kyoto and Osaka but is listed once.");
        assert(std::count(files.begin(), files.end(), first) == 1);
        assert(std::count(files.begin(), files.end(), second) == 1);
        assert(store.findByEntities({"Kyoto", "Osaka"}, 1).size() == 1);
        assert(store.findByEntities({"Hokkaido"}, 3).empty());
        assert(store.findByEntities({"100%"}, 3).empty() && "LIKE wildcards in entities are literal.");
        std::cout << "[PASS] findByEntities." << std::endl;

        // Missing and corrupt files
        assert(LoadErrorKind(store, "2024-03/archive_missing.json") == ErrorKind::NotFound);
        {
            std::ofstream corrupt(store.root() / "2024-03" / "broken.json");
            corrupt << "[{\"id\": \"truncated";
        }
        assert(LoadErrorKind(store, "2024-03/broken.json") == ErrorKind::Corrupt);
        assert(LoadErrorKind(store, "../archive_index.db") == ErrorKind::NotFound);
        std::cout << "[PASS] Missing / corrupt files." << std::endl;
    }

    // Collision suffixes keep lexical order equal to write order past ten files
    {
        fs::path dir = fs::path(testRoot) / "numbered";
        std::vector<std::string> written;
        for (int i = 0; i < 12; ++i) {
            written.push_back(AtomicFileWriter::writeNumbered(dir, "archive_20240301_120000", "[]"));
        }
        assert(written[0] == "archive_20240301_120000.json");
        assert(written[1] == "archive_20240301_120000_0001.json");
        assert(written[11] == "archive_20240301_120000_0011.json");
        std::vector<std::string> sorted = written;
        std::sort(sorted.begin(), sorted.end());
        assert(sorted == written && "Suffixed names sort in write order.");
        std::cout << "[PASS] Numbered file names." << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
