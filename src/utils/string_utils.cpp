/**
 * @file string_utils.cpp
 * @brief String utility functions implementation
 */

#include "person/utils/string_utils.h"

namespace person {
namespace utils {

namespace {

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

/**
 * Decode one UTF-8 sequence starting at pos.
 * Returns its length in bytes, or 0 if the bytes at pos are not a valid
 * (shortest-form, non-surrogate) sequence.
 */
size_t decodeUtf8(const std::string& str, size_t pos, char32_t& codePoint) {
    unsigned char lead = static_cast<unsigned char>(str[pos]);
    size_t length;
    char32_t minimum;

    if (lead < 0x80) {
        codePoint = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        minimum = 0x80;
        codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        minimum = 0x800;
        codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        minimum = 0x10000;
        codePoint = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > str.length()) {
        return 0;
    }
    for (size_t i = 1; i < length; ++i) {
        unsigned char c = static_cast<unsigned char>(str[pos + i]);
        if (!isContinuation(c)) {
            return 0;
        }
        codePoint = (codePoint << 6) | (c & 0x3F);
    }

    if (codePoint < minimum || codePoint > 0x10FFFF ||
        (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
        return 0;
    }
    return length;
}

} // namespace

bool isWhitespace(char32_t codePoint) {
    if (codePoint >= 0x09 && codePoint <= 0x0D) return true;   // \t \n \v \f \r
    if (codePoint >= 0x1C && codePoint <= 0x20) return true;   // FS GS RS US, space
    if (codePoint < 0x1680) return false;

    switch (codePoint) {
        case 0x1680:  // ogham space mark
        case 0x2028:  // line separator
        case 0x2029:  // paragraph separator
        case 0x205F:  // medium mathematical space
        case 0x3000:  // ideographic space
            return true;
        default:
            break;
    }
    // En quad .. hair space, minus figure space (U+2007, no-break)
    return codePoint >= 0x2000 && codePoint <= 0x200A && codePoint != 0x2007;
}

std::string trim(const std::string& str) {
    // Byte range [start, end) spanning the first to the last non-whitespace code point
    size_t start = str.length();
    size_t end = 0;

    size_t pos = 0;
    while (pos < str.length()) {
        char32_t codePoint = 0;
        size_t length = decodeUtf8(str, pos, codePoint);
        bool whitespace = length > 0 && isWhitespace(codePoint);
        if (length == 0) {
            length = 1;  // invalid byte, kept as content
        }

        if (!whitespace) {
            if (start == str.length()) {
                start = pos;
            }
            end = pos + length;
        }
        pos += length;
    }

    // If all whitespace, return empty string
    if (start >= end) {
        return "";
    }
    return str.substr(start, end - start);
}

bool isBlank(const std::string& str) {
    return trim(str).empty();
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

} // namespace utils
} // namespace person
