/**
 * @file JsonCodec.cpp
 * @brief Implementation of JsonCodec.
 */

#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/TimeUtils.hpp"
#include "domain/StorageError.hpp"
#include <algorithm>

namespace engram::infrastructure {

using json = nlohmann::json;
using domain::ErrorKind;
using domain::StorageError;

namespace {

std::chrono::system_clock::time_point ParseTimestamp(const json& j, const char* key) {
    auto parsed = TimeUtils::ParseIso8601(j.at(key).get<std::string>());
    if (!parsed) {
        throw StorageError(ErrorKind::Corrupt, std::string("Malformed timestamp in field '") + key + "'");
    }
    return *parsed;
}

} // namespace

json JsonCodec::SourceToJson(const domain::RecordSource& source) {
    json j;
    std::visit([&](auto&& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, domain::DirectExperience>) {
            j = {{"kind", "DirectExperience"}};
        } else if constexpr (std::is_same_v<T, domain::Researched>) {
            j = {
                {"kind", "Researched"},
                {"origin", s.origin},
                {"original_query", s.originalQuery},
                {"timestamp", TimeUtils::ToIso8601(s.timestamp)}
            };
        }
    }, source);
    return j;
}

domain::RecordSource JsonCodec::SourceFromJson(const json& j) {
    if (!j.is_object()) {
        return domain::DirectExperience{};
    }
    std::string kind = j.value("kind", "DirectExperience");
    if (kind == "Researched") {
        domain::Researched r;
        r.origin = j.value("origin", "");
        r.originalQuery = j.value("original_query", "");
        r.timestamp = ParseTimestamp(j, "timestamp");
        return r;
    }
    return domain::DirectExperience{};
}

json JsonCodec::RecordToJson(const domain::Record& record) {
    return {
        {"id", record.id},
        {"content", record.content},
        {"timestamp", TimeUtils::ToIso8601(record.timestamp)},
        {"entities", record.entities},
        {"connections", record.connections},
        {"record_type", domain::RecordTypeToString(record.recordType)},
        {"valence", record.valence},
        {"source", SourceToJson(record.source)},
        {"confidence", record.confidence}
    };
}

domain::Record JsonCodec::RecordFromJson(const json& j) {
    try {
        domain::Record record;
        record.id = j.at("id").get<std::string>();
        record.content = j.at("content").get<std::string>();
        record.timestamp = ParseTimestamp(j, "timestamp");
        for (const auto& e : j.value("entities", std::vector<std::string>{})) {
            record.addEntity(e);
        }
        for (const auto& c : j.value("connections", std::vector<std::string>{})) {
            record.addConnection(c);
        }
        record.recordType = domain::RecordTypeFromString(j.value("record_type", "Interaction"));
        record.valence = std::clamp(j.value("valence", 0.0f), -1.0f, 1.0f);
        if (j.contains("source")) {
            record.source = SourceFromJson(j.at("source"));
        }
        record.confidence = std::clamp(j.value("confidence", 1.0f), 0.0f, 1.0f);
        if (record.id.empty()) {
            throw StorageError(ErrorKind::Corrupt, "Record without id");
        }
        return record;
    } catch (const json::exception& e) {
        throw StorageError(ErrorKind::Corrupt, std::string("Malformed record: ") + e.what());
    }
}

std::string JsonCodec::EncodeRecords(const std::vector<domain::Record>& records) {
    json arr = json::array();
    for (const auto& record : records) {
        arr.push_back(RecordToJson(record));
    }
    // Invalid UTF-8 in content is replaced rather than aborting the archive write
    return arr.dump(2, ' ', false, json::error_handler_t::replace);
}

std::vector<domain::Record> JsonCodec::DecodeRecords(const std::string& text) {
    json arr;
    try {
        arr = json::parse(text);
    } catch (const json::parse_error& e) {
        throw StorageError(ErrorKind::Corrupt, std::string("Archive parse error: ") + e.what());
    }
    if (!arr.is_array()) {
        throw StorageError(ErrorKind::Corrupt, "Archive content is not a JSON array");
    }

    std::vector<domain::Record> records;
    records.reserve(arr.size());
    for (const auto& item : arr) {
        records.push_back(RecordFromJson(item));
    }
    return records;
}

json JsonCodec::StateToJson(const domain::PersistedState& state) {
    return {
        {"version", state.version},
        {"last_update", state.lastUpdate},
        {"field_data", state.fieldData},
        {"cognitive_tensor", state.cognitiveTensor},
        {"memory_embeddings", state.memoryEmbeddings},
        {"satisfaction", state.satisfaction},
        {"affirmation", state.affirmation}
    };
}

domain::PersistedState JsonCodec::StateFromJson(const json& j) {
    try {
        domain::PersistedState state;
        state.version = j.at("version").get<uint64_t>();
        state.lastUpdate = j.at("last_update").get<double>();
        state.fieldData = j.at("field_data").get<std::vector<double>>();
        state.cognitiveTensor = j.value("cognitive_tensor", std::vector<double>{});
        state.memoryEmbeddings = j.value("memory_embeddings", std::vector<double>{});
        state.satisfaction = j.value("satisfaction", 0.0);
        state.affirmation = j.value("affirmation", 0.0);
        return state;
    } catch (const json::exception& e) {
        throw StorageError(ErrorKind::Corrupt, std::string("Malformed state: ") + e.what());
    }
}

std::string JsonCodec::EncodeState(const domain::PersistedState& state) {
    return StateToJson(state).dump(4);
}

domain::PersistedState JsonCodec::DecodeState(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw StorageError(ErrorKind::Corrupt, std::string("State parse error: ") + e.what());
    }
    return StateFromJson(j);
}

std::string JsonCodec::EncodeSource(const domain::RecordSource& source) {
    return SourceToJson(source).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string JsonCodec::EncodeStringList(const std::vector<std::string>& values) {
    return json(values).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::vector<std::string> JsonCodec::DecodeStringList(const std::string& text) {
    try {
        auto j = json::parse(text);
        if (j.is_array()) {
            return j.get<std::vector<std::string>>();
        }
    } catch (const json::exception&) {
        // Treated as an empty list
    }
    return {};
}

} // namespace engram::infrastructure
