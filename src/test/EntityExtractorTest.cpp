#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include <algorithm>

#include "domain/services/EntityExtractor.hpp"

using namespace engram::domain::services;

namespace {

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

int main() {
    std::cout << "[Test] Starting EntityExtractor Test..." << std::endl;

    // Multi-word capitalized phrases stay together
    auto entities = EntityExtractor::Extract("We flew over New York City before landing in Boston.");
    assert(Contains(entities, "New York City") && "Capitalized run should form one entity.");
    assert(Contains(entities, "Boston"));
    assert(!Contains(entities, "New") && "Phrase parts should not be separate entities.");
    assert(!Contains(entities, "We") && "Leading pronoun alone is not an entity.");
    std::cout << "[PASS] Capitalized phrases." << std::endl;

    // Articles and pronouns are stripped from the front of a phrase
    entities = EntityExtractor::Extract("The Louvre was closed. She said it again. This time they waited.");
    assert(Contains(entities, "Louvre"));
    assert(!Contains(entities, "The Louvre"));
    assert(!Contains(entities, "She"));
    assert(!Contains(entities, "This"));
    assert(entities.size() == 1);
    std::cout << "[PASS] Stop-list." << std::endl;

    // Quoted substrings are taken verbatim
    entities = EntityExtractor::Extract("I keep thinking about \"quantum entanglement\" and \"why\".");
    assert(Contains(entities, "quantum entanglement"));
    assert(Contains(entities, "why"));
    std::cout << "[PASS] Quoted substrings." << std::endl;

    // Duplicates collapse, first occurrence order is kept
    entities = EntityExtractor::Extract("Paris in spring. Paris in autumn. Rome, then Paris.");
    assert(std::count(entities.begin(), entities.end(), "Paris") == 1);
    assert(Contains(entities, "Rome"));
    assert(entities.front() == "Paris");
    std::cout << "[PASS] Deduplication." << std::endl;

    // Phrases broken across lines are normalized to single spaces
    entities = EntityExtractor::Extract("visiting San\nFrancisco soon");
    assert(Contains(entities, "San Francisco"));
    std::cout << "[PASS] Whitespace normalization." << std::endl;

    // Nothing to extract is not an error
    assert(EntityExtractor::Extract("").empty());
    assert(EntityExtractor::Extract("all lowercase words only").empty());
    assert(EntityExtractor::IsStopWord("The"));
    assert(!EntityExtractor::IsStopWord("Tokyo"));
    std::cout << "[PASS] Empty input." << std::endl;

    // Very long notes are scanned without blowing the stack
    std::string longQuote = std::string(200000, 'x');
    entities = EntityExtractor::Extract("Notes: \"" + longQuote + "\"");
    assert(entities.size() == 2);
    assert(entities[0] == "Notes");
    assert(entities[1] == longQuote);

    std::string longPhrase;
    for (int i = 0; i < 40000; ++i) longPhrase += "Word ";
    entities = EntityExtractor::Extract(longPhrase);
    assert(entities.size() == 1 && "One capitalized run is one entity.");
    assert(entities[0].size() == longPhrase.size() - 1);

    std::string manyWords;
    for (int i = 0; i < 40000; ++i) manyWords += "lower Upper ";
    entities = EntityExtractor::Extract(manyWords);
    assert(entities.size() == 1 && entities[0] == "Upper");
    std::cout << "[PASS] Long input." << std::endl;

    // Word boundaries and unmatched quotes
    entities = EntityExtractor::Extract("McDonald and Paris2 and Oslo_x but Bergen, \"\"");
    assert(entities.size() == 1 && entities[0] == "Bergen");
    assert(EntityExtractor::Extract("a lone \"quote").empty());
    std::cout << "[PASS] Boundaries." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
