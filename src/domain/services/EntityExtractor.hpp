/**
 * @file EntityExtractor.hpp
 * @brief Heuristic keyword extraction used to index records.
 */

#pragma once
#include <string>
#include <vector>

namespace engram::domain::services {

/**
 * @class EntityExtractor
 * @brief Pulls capitalized phrases and quoted substrings out of free text.
 *
 * Rules:
 *  - Runs of capitalized words ("New York City") form one entity.
 *  - A leading article or pronoun ("The", "I", ...) is stripped from a phrase;
 *    a phrase made only of such a word is dropped.
 *  - Every double-quoted substring is an entity verbatim.
 * Results keep first-seen order without duplicates. Never fails.
 */
class EntityExtractor {
public:
    static std::vector<std::string> Extract(const std::string& text);

    /** @brief True for words ignored at the start of a capitalized phrase. */
    static bool IsStopWord(const std::string& word);
};

} // namespace engram::domain::services
