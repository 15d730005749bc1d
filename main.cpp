#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/EngramSession.hpp"
#include "application/LegacyMigrator.hpp"
#include "application/MemoryManager.hpp"
#include "application/PersistenceEngine.hpp"
#include "domain/StorageError.hpp"
#include "infrastructure/ArchiveStoreFs.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/SqliteActiveStore.hpp"
#include "infrastructure/TimeUtils.hpp"

namespace fs = std::filesystem;
using namespace engram;

namespace {

struct CliOptions {
    fs::path dataRoot;
    std::string command;
    std::vector<std::string> args;
};

void PrintUsage() {
    std::cout << "Usage: engram [--data <dir>] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  add <type> <valence> <content...>   Store a record, print its id\n"
              << "  recall <n> [entity...]              Print the n best matching records\n"
              << "  consolidate                         Merge near-duplicate active records\n"
              << "  stats                               Show tier sizes and data root\n"
              << "  migrate <legacy.json>               Import a legacy record stream\n"
              << "  snapshot                            Persist the state once\n"
              << "  recover                             Print the recovered state\n"
              << "  session                             Store each stdin line, snapshotting in the background\n";
}

std::unique_ptr<application::MemoryManager> OpenManager(const fs::path& dataRoot,
                                                        const domain::EngramConfig& config) {
    auto active = std::make_unique<infrastructure::SqliteActiveStore>(
        infrastructure::PathUtils::GetActiveDbPath(dataRoot).string());
    auto archive = std::make_unique<infrastructure::ArchiveStoreFs>(
        infrastructure::PathUtils::GetArchiveDir(dataRoot),
        infrastructure::PathUtils::GetArchiveIndexPath(dataRoot).string(),
        config.previewLength);
    return std::make_unique<application::MemoryManager>(std::move(active), std::move(archive), config);
}

void PrintRecord(const domain::Record& record) {
    std::cout << record.id << "  " << infrastructure::TimeUtils::ToIso8601(record.timestamp)
              << "  " << domain::RecordTypeToString(record.recordType)
              << "  valence=" << std::fixed << std::setprecision(2) << record.valence << "\n";
    if (!record.entities.empty()) {
        std::cout << "    entities:";
        for (const auto& e : record.entities) std::cout << " [" << e << "]";
        std::cout << "\n";
    }
    std::cout << "    " << record.content << "\n";
}

int RunCommand(const CliOptions& opts) {
    fs::create_directories(opts.dataRoot);
    domain::EngramConfig config = infrastructure::ConfigLoader::Load(opts.dataRoot.string());
    config.validate();

    if (opts.command == "snapshot" || opts.command == "recover") {
        application::PersistenceEngine engine(infrastructure::PathUtils::GetStateDir(opts.dataRoot),
                                              config.snapshotRetention);
        if (opts.command == "recover") {
            auto state = engine.recover();
            std::cout << "version=" << state.version << " last_update=" << std::fixed
                      << std::setprecision(3) << state.lastUpdate
                      << " field_data=" << state.fieldData.size() << " values" << std::endl;
            return 0;
        }

        const bool fresh = engine.store().empty();
        domain::PersistedState state = engine.recoverOrInitial();
        if (!fresh) {
            state.touch();
        }
        engine.persist(state);
        std::cout << "Persisted state v" << state.version << std::endl;
        return 0;
    }

    auto manager = OpenManager(opts.dataRoot, config);

    if (opts.command == "add") {
        if (opts.args.size() < 3) {
            PrintUsage();
            return 2;
        }
        float valence = std::stof(opts.args[1]);
        std::string content;
        for (size_t i = 2; i < opts.args.size(); ++i) {
            if (i > 2) content += " ";
            content += opts.args[i];
        }
        std::cout << manager->add(content, domain::RecordTypeFromString(opts.args[0]), valence) << std::endl;
        return 0;
    }

    if (opts.command == "recall") {
        if (opts.args.empty()) {
            PrintUsage();
            return 2;
        }
        size_t n = static_cast<size_t>(std::stoul(opts.args[0]));
        std::vector<std::string> entities(opts.args.begin() + 1, opts.args.end());
        for (const auto& record : manager->recall(entities, n)) {
            PrintRecord(record);
        }
        return 0;
    }

    if (opts.command == "consolidate") {
        auto report = manager->consolidate();
        std::cout << "merged=" << report.merged << " remaining=" << report.remaining << std::endl;
        return 0;
    }

    if (opts.command == "stats") {
        std::cout << "data root:        " << opts.dataRoot.string() << "\n"
                  << "active records:   " << manager->count() << " / " << config.activeLimit << "\n"
                  << "archived records: " << manager->archivedCount() << std::endl;
        return 0;
    }

    if (opts.command == "session") {
        application::PersistenceEngine engine(infrastructure::PathUtils::GetStateDir(opts.dataRoot),
                                              config.snapshotRetention);
        application::EngramSession session(*manager, engine,
                                           std::chrono::milliseconds(config.snapshotIntervalMs));
        session.open();
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) continue;
            std::cout << session.record(line, domain::RecordType::Interaction, 0.0f) << std::endl;
        }
        auto state = session.close();
        std::cout << "Persisted state v" << state.version << std::endl;
        return 0;
    }

    if (opts.command == "migrate") {
        if (opts.args.size() != 1) {
            PrintUsage();
            return 2;
        }
        application::LegacyMigrator migrator(*manager);
        auto report = migrator.migrateFile(opts.args[0]);
        std::cout << "active=" << report.active << " archived=" << report.archived
                  << " skipped=" << report.skipped << std::endl;
        return 0;
    }

    std::cerr << "[Engram] Unknown command: " << opts.command << std::endl;
    PrintUsage();
    return 2;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    opts.dataRoot = infrastructure::PathUtils::GetDataHome();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (opts.command.empty() && arg == "--data") {
            if (i + 1 >= argc) {
                PrintUsage();
                return 2;
            }
            opts.dataRoot = argv[++i];
        } else if (opts.command.empty() && (arg == "-h" || arg == "--help")) {
            PrintUsage();
            return 0;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }

    if (opts.command.empty()) {
        PrintUsage();
        return 2;
    }

    try {
        return RunCommand(opts);
    } catch (const domain::StorageError& e) {
        std::cerr << "[Engram] " << domain::ErrorKindToString(e.kind()) << ": " << e.what() << std::endl;
        if (e.kind() == domain::ErrorKind::NoConsistentState) {
            std::cerr << "[Engram] !!! Recovery failed: no usable state in primary, backup or archive !!!"
                      << std::endl;
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Engram] Error: " << e.what() << std::endl;
        return 1;
    }
}
