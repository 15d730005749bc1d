/**
 * @file Record.hpp
 * @brief Domain entity for a single stored record and its provenance.
 */

#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <variant>
#include <algorithm>

namespace engram::domain {

/**
 * @enum RecordType
 * @brief Fixed categories a record can belong to.
 */
enum class RecordType {
    Interaction,
    Reflection,
    Curiosity,
    EmotionalState,
    WisdomTransformation,
    ExistentialReflection
};

inline std::string RecordTypeToString(RecordType type) {
    switch (type) {
        case RecordType::Interaction: return "Interaction";
        case RecordType::Reflection: return "Reflection";
        case RecordType::Curiosity: return "Curiosity";
        case RecordType::EmotionalState: return "EmotionalState";
        case RecordType::WisdomTransformation: return "WisdomTransformation";
        case RecordType::ExistentialReflection: return "ExistentialReflection";
        default: return "Interaction";
    }
}

/**
 * @brief Parses the enumerator name. Unknown names map to Interaction.
 */
inline RecordType RecordTypeFromString(const std::string& str) {
    if (str == "Reflection") return RecordType::Reflection;
    if (str == "Curiosity") return RecordType::Curiosity;
    if (str == "EmotionalState") return RecordType::EmotionalState;
    if (str == "WisdomTransformation") return RecordType::WisdomTransformation;
    if (str == "ExistentialReflection") return RecordType::ExistentialReflection;
    return RecordType::Interaction;
}

/// Record produced from first-hand interaction.
struct DirectExperience {};

/// Record produced by an external lookup.
struct Researched {
    std::string origin;         ///< Where the content came from.
    std::string originalQuery;  ///< Question that triggered the lookup.
    std::chrono::system_clock::time_point timestamp;
};

using RecordSource = std::variant<DirectExperience, Researched>;

/**
 * @class Record
 * @brief Atomic unit of stored data, living in exactly one tier at a time.
 */
class Record {
public:
    std::string id;                          ///< Opaque, immutable identifier.
    std::string content;                     ///< Text payload.
    std::chrono::system_clock::time_point timestamp; ///< Creation time; sole ordering key.
    std::vector<std::string> entities;       ///< Extracted keywords, unique.
    std::vector<std::string> connections;    ///< Related record ids, unique.
    RecordType recordType = RecordType::Interaction;
    float valence = 0.0f;                    ///< In [-1, 1].
    RecordSource source = DirectExperience{};
    float confidence = 1.0f;                 ///< In [0, 1].

    Record() = default;

    /**
     * @brief Creates a record with a fresh id and the current time.
     * Valence and confidence are clamped into range.
     */
    static Record Create(std::string content,
                         std::vector<std::string> entities,
                         RecordType type,
                         float valence,
                         RecordSource source = DirectExperience{},
                         float confidence = 1.0f);

    /** @brief Generates a random 32 hex character id. */
    static std::string GenerateId();

    /** @brief Adds an entity unless it is already present. */
    bool addEntity(const std::string& entity) {
        if (hasEntity(entity)) return false;
        entities.push_back(entity);
        return true;
    }

    bool hasEntity(const std::string& entity) const {
        return std::find(entities.begin(), entities.end(), entity) != entities.end();
    }

    /** @brief Adds a connection unless present or pointing at this record. */
    bool addConnection(const std::string& otherId) {
        if (otherId == id || isConnectedTo(otherId)) return false;
        connections.push_back(otherId);
        return true;
    }

    bool isConnectedTo(const std::string& otherId) const {
        return std::find(connections.begin(), connections.end(), otherId) != connections.end();
    }

    bool isResearched() const { return std::holds_alternative<Researched>(source); }

    /** @brief Whole seconds since the Unix epoch. */
    long long unixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch()).count();
    }
};

} // namespace engram::domain
