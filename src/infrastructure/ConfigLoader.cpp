/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace engram::infrastructure {

domain::EngramConfig ConfigLoader::Load(const std::string& dataRoot) {
    domain::EngramConfig config;
    std::filesystem::path configPath = std::filesystem::path(dataRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        config.activeLimit = j.value("active_limit", config.activeLimit);
        config.evictionBatch = j.value("eviction_batch", config.evictionBatch);
        config.connectionThreshold = j.value("connection_threshold", config.connectionThreshold);
        config.weakConnectionThreshold = j.value("weak_connection_threshold", config.weakConnectionThreshold);
        config.valenceProximity = j.value("valence_proximity", config.valenceProximity);
        config.mergeThreshold = j.value("merge_threshold", config.mergeThreshold);
        config.archiveLookupFiles = j.value("archive_lookup_files", config.archiveLookupFiles);
        config.previewLength = j.value("preview_length", config.previewLength);
        config.mergeExcerptLength = j.value("merge_excerpt_length", config.mergeExcerptLength);
        config.snapshotRetention = j.value("snapshot_retention", config.snapshotRetention);
        config.snapshotIntervalMs = j.value("snapshot_interval_ms", config.snapshotIntervalMs);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what()
                  << " (using defaults)" << std::endl;
        return domain::EngramConfig{};
    }

    return config;
}

void ConfigLoader::Save(const std::string& dataRoot, const domain::EngramConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(dataRoot) / "settings.json";
    nlohmann::json j = nlohmann::json::object();

    // Keep unrelated keys from an existing, readable file
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
            if (!j.is_object()) {
                j = nlohmann::json::object();
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Replacing unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["active_limit"] = config.activeLimit;
    j["eviction_batch"] = config.evictionBatch;
    j["connection_threshold"] = config.connectionThreshold;
    j["weak_connection_threshold"] = config.weakConnectionThreshold;
    j["valence_proximity"] = config.valenceProximity;
    j["merge_threshold"] = config.mergeThreshold;
    j["archive_lookup_files"] = config.archiveLookupFiles;
    j["preview_length"] = config.previewLength;
    j["merge_excerpt_length"] = config.mergeExcerptLength;
    j["snapshot_retention"] = config.snapshotRetention;
    j["snapshot_interval_ms"] = config.snapshotIntervalMs;

    AtomicFileWriter::write(configPath, j.dump(4));
}

} // namespace engram::infrastructure
