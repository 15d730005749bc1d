/**
 * @file TextUtils.hpp
 * @brief UTF-8 aware string helpers.
 */

#pragma once

#include <string>

namespace engram::domain::services {

/**
 * @brief Returns at most maxChars code points from the start of text.
 * Never splits a multi-byte sequence.
 */
inline std::string Utf8Prefix(const std::string& text, size_t maxChars) {
    size_t chars = 0;
    size_t i = 0;
    while (i < text.size() && chars < maxChars) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        if (i + len > text.size()) break;
        i += len;
        ++chars;
    }
    return text.substr(0, i);
}

} // namespace engram::domain::services
