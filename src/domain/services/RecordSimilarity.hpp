/**
 * @file RecordSimilarity.hpp
 * @brief Domain service comparing records by entity overlap and valence.
 */

#pragma once

#include <string>
#include <vector>
#include <cmath>
#include <unordered_set>
#include "domain/Record.hpp"

namespace engram::domain::services {

/**
 * @struct ConnectionRule
 * @brief Thresholds deciding when two records are related.
 */
struct ConnectionRule {
    float strongOverlap = 0.7f;     ///< Ratio above which records always connect.
    float weakOverlap = 0.3f;       ///< Ratio above which close valences connect.
    float valenceProximity = 0.3f;  ///< Valence gap counted as "close".
};

class RecordSimilarity {
public:
    /**
     * @brief Shared entities divided by the size of the union. 0 when both sets are empty.
     */
    static float sharedEntityRatio(const std::vector<std::string>& a, const std::vector<std::string>& b) {
        if (a.empty() && b.empty()) return 0.0f;

        std::unordered_set<std::string> left(a.begin(), a.end());
        std::unordered_set<std::string> right(b.begin(), b.end());

        size_t shared = 0;
        for (const auto& e : left) {
            if (right.count(e)) ++shared;
        }
        size_t unionSize = left.size() + right.size() - shared;
        if (unionSize == 0) return 0.0f;
        return static_cast<float>(shared) / static_cast<float>(unionSize);
    }

    static float sharedEntityRatio(const Record& a, const Record& b) {
        return sharedEntityRatio(a.entities, b.entities);
    }

    static bool isConnected(const Record& a, const Record& b, const ConnectionRule& rule) {
        float ratio = sharedEntityRatio(a, b);
        if (ratio > rule.strongOverlap) return true;
        bool closeValence = std::fabs(a.valence - b.valence) < rule.valenceProximity;
        return ratio > rule.weakOverlap && closeValence;
    }

    /**
     * @brief Adds every related existing record to record.connections.
     */
    static void buildConnections(Record& record, const std::vector<Record>& existing, const ConnectionRule& rule) {
        for (const auto& other : existing) {
            if (other.id == record.id) continue;
            if (isConnected(record, other, rule)) {
                record.addConnection(other.id);
            }
        }
    }

    static bool shouldMerge(const Record& a, const Record& b, float mergeThreshold) {
        return sharedEntityRatio(a, b) > mergeThreshold;
    }
};

} // namespace engram::domain::services
