/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Case conversion, UTF-8 character iteration and the storage-safe
 * sanitizer shared by the name parser and the upload name composer.
 */

#pragma once

#include <string>
#include <vector>

namespace storagefile {
namespace utils {

/// Placeholder written in place of ASCII characters outside the storage-safe alphabet
constexpr char STORAGE_PLACEHOLDER = '_';

/**
 * @brief Convert ASCII letters to lowercase, other bytes untouched
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Check if string contains only ASCII characters
 *
 * @param str Input string
 * @return true if all characters are ASCII (0-127)
 */
bool isAscii(const std::string& str);

/**
 * @brief Check if string is valid UTF-8
 *
 * Rejects overlong encodings, surrogates and code points above U+10FFFF.
 *
 * @param str Input string
 * @return true if valid UTF-8 encoding
 */
bool isValidUtf8(const std::string& str);

/**
 * @brief Split a string into characters
 *
 * Each element holds one UTF-8 encoded character. A byte that does not
 * start a well-formed sequence becomes an element of its own, so the
 * concatenation of the result always equals the input.
 *
 * @param str Input string (any bytes)
 * @return One entry per character
 */
std::vector<std::string> utf8Characters(const std::string& str);

/**
 * @brief Check membership in the storage-safe alphabet
 *
 * ASCII letters, digits, '-' and '_'.
 */
bool isStorageSafeChar(char c);

/**
 * @brief Check that every byte belongs to the storage-safe alphabet
 */
bool isStorageSafe(const std::string& str);

/**
 * @brief Sanitize text for use inside a persisted file name
 *
 * Walks the input character by character:
 * - storage-safe characters and those listed in @p extraAllowed are kept
 * - other ASCII characters are replaced by STORAGE_PLACEHOLDER, one for one
 * - non-ASCII characters and malformed bytes are dropped
 *
 * The result only contains storage-safe characters (plus @p extraAllowed),
 * and sanitizing it again returns it unchanged.
 *
 * @param str Raw text
 * @param extraAllowed Additional ASCII characters to keep verbatim
 * @return Sanitized text
 */
std::string sanitizeForStorage(const std::string& str, const std::string& extraAllowed = "");

} // namespace utils
} // namespace storagefile
