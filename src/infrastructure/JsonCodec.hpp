/**
 * @file JsonCodec.hpp
 * @brief Self-describing JSON mapping for records and persisted state.
 */

#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Record.hpp"
#include "domain/PersistedState.hpp"

namespace engram::infrastructure {

/**
 * @class JsonCodec
 * @brief Manual field mapping between domain objects and nlohmann::json.
 *
 * Decoding failures throw domain::StorageError with kind Corrupt.
 */
class JsonCodec {
public:
    static nlohmann::json SourceToJson(const domain::RecordSource& source);
    static domain::RecordSource SourceFromJson(const nlohmann::json& j);

    /** @brief Compact source object; invalid UTF-8 is replaced, never thrown. */
    static std::string EncodeSource(const domain::RecordSource& source);

    static nlohmann::json RecordToJson(const domain::Record& record);
    static domain::Record RecordFromJson(const nlohmann::json& j);

    /** @brief Pretty-printed array of records, as written to archive files. */
    static std::string EncodeRecords(const std::vector<domain::Record>& records);
    static std::vector<domain::Record> DecodeRecords(const std::string& text);

    static nlohmann::json StateToJson(const domain::PersistedState& state);
    static domain::PersistedState StateFromJson(const nlohmann::json& j);

    static std::string EncodeState(const domain::PersistedState& state);
    static domain::PersistedState DecodeState(const std::string& text);

    /** @brief Compact JSON array of strings, used for SQLite text columns. */
    static std::string EncodeStringList(const std::vector<std::string>& values);

    /** @brief Lenient inverse of EncodeStringList: malformed input yields an empty list. */
    static std::vector<std::string> DecodeStringList(const std::string& text);
};

} // namespace engram::infrastructure
