/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Whitespace handling used by the name rule and error-message joining.
 * Strings are UTF-8. Whitespace is the set of code points accepted by
 * isWhitespace() below.
 */

#pragma once

#include <string>
#include <vector>

namespace person {
namespace utils {

/**
 * @brief Check if a Unicode code point is whitespace
 *
 * True for U+0009..U+000D, U+001C..U+001F, U+0020, U+1680, U+2000..U+2006,
 * U+2008..U+200A, U+2028, U+2029, U+205F and U+3000.
 * The no-break spaces U+00A0, U+2007 and U+202F are not whitespace.
 *
 * @param codePoint Unicode scalar value
 */
bool isWhitespace(char32_t codePoint);

/**
 * @brief Trim whitespace from both ends
 *
 * Decodes UTF-8. Bytes that do not form a valid UTF-8 sequence are kept
 * and never count as whitespace.
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Check if string is empty or contains only whitespace
 *
 * @param str Input string
 * @return true if trim(str) is empty
 */
bool isBlank(const std::string& str);

/**
 * @brief Join strings with delimiter
 *
 * @param parts Vector of strings
 * @param delimiter Delimiter string
 * @return Joined string
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

} // namespace utils
} // namespace person
