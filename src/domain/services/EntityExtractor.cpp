/**
 * @file EntityExtractor.cpp
 * @brief Implementation of EntityExtractor.
 */

#include "domain/services/EntityExtractor.hpp"
#include <algorithm>
#include <array>

namespace engram::domain::services {

namespace {

// ASCII classes only; bytes of multi-byte UTF-8 sequences are never word characters.
bool IsUpper(char c) { return c >= 'A' && c <= 'Z'; }
bool IsLower(char c) { return c >= 'a' && c <= 'z'; }
bool IsWordChar(char c) {
    return IsUpper(c) || IsLower(c) || (c >= '0' && c <= '9') || c == '_';
}
bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// End of a capitalized word ("Paris") starting at pos, or pos if there is none.
// The word must stand alone: no word character directly before or after it.
size_t CapitalizedWordEnd(const std::string& text, size_t pos) {
    if (pos >= text.size() || !IsUpper(text[pos])) return pos;
    if (pos > 0 && IsWordChar(text[pos - 1])) return pos;
    size_t end = pos + 1;
    while (end < text.size() && IsLower(text[end])) ++end;
    if (end == pos + 1) return pos;
    if (end < text.size() && IsWordChar(text[end])) return pos;
    return end;
}

void PushUnique(std::vector<std::string>& out, const std::string& value) {
    if (value.empty()) return;
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(value);
    }
}

// Phrases may span line breaks; store them with single spaces.
std::string CollapseWhitespace(const std::string& phrase) {
    std::string out;
    out.reserve(phrase.size());
    bool pendingSpace = false;
    for (char c : phrase) {
        if (IsSpace(c)) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !out.empty()) out += ' ';
        pendingSpace = false;
        out += c;
    }
    return out;
}

} // namespace

bool EntityExtractor::IsStopWord(const std::string& word) {
    static const std::array<const char*, 13> stopWords = {
        "The", "A", "An", "I", "It", "He", "She", "We", "They", "This", "That", "My", "Our"
    };
    return std::any_of(stopWords.begin(), stopWords.end(),
                       [&](const char* s) { return word == s; });
}

std::vector<std::string> EntityExtractor::Extract(const std::string& text) {
    std::vector<std::string> entities;
    if (text.empty()) return entities;

    // Runs of capitalized words separated by whitespace
    size_t pos = 0;
    while (pos < text.size()) {
        size_t phraseEnd = CapitalizedWordEnd(text, pos);
        if (phraseEnd == pos) {
            ++pos;
            continue;
        }
        for (;;) {
            size_t next = phraseEnd;
            while (next < text.size() && IsSpace(text[next])) ++next;
            if (next == phraseEnd) break;
            size_t wordEnd = CapitalizedWordEnd(text, next);
            if (wordEnd == next) break;
            phraseEnd = wordEnd;
        }

        std::string phrase = CollapseWhitespace(text.substr(pos, phraseEnd - pos));
        pos = phraseEnd;

        // Drop a leading article/pronoun: "The Louvre" -> "Louvre"
        size_t firstSpace = phrase.find(' ');
        if (IsStopWord(phrase.substr(0, firstSpace))) {
            if (firstSpace == std::string::npos) continue;
            phrase = phrase.substr(firstSpace + 1);
        }
        PushUnique(entities, phrase);
    }

    // Non-empty text between a pair of double quotes
    size_t open = text.find('"');
    while (open != std::string::npos) {
        size_t close = text.find('"', open + 1);
        if (close == std::string::npos) break;
        if (close == open + 1) {
            open = close;
            continue;
        }
        PushUnique(entities, text.substr(open + 1, close - open - 1));
        open = text.find('"', close + 1);
    }

    return entities;
}

} // namespace engram::domain::services
