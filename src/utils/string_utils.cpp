/**
 * @file string_utils.cpp
 * @brief String utility functions implementation
 */

#include "storagefile/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace storagefile {
namespace utils {

namespace {

/**
 * @brief Length of the well-formed UTF-8 sequence starting at pos, 0 if none
 */
size_t utf8SequenceLength(const std::string& str, size_t pos) {
    const auto lead = static_cast<uint8_t>(str[pos]);

    if (lead < 0x80) {
        return 1;
    }

    size_t length = 0;
    uint8_t minSecond = 0x80;
    uint8_t maxSecond = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) minSecond = 0xA0;      // overlong
        if (lead == 0xED) maxSecond = 0x9F;      // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) minSecond = 0x90;      // overlong
        if (lead == 0xF4) maxSecond = 0x8F;      // > U+10FFFF
    } else {
        return 0;
    }

    if (pos + length > str.size()) {
        return 0;
    }

    const auto second = static_cast<uint8_t>(str[pos + 1]);
    if (second < minSecond || second > maxSecond) {
        return 0;
    }

    for (size_t i = 2; i < length; ++i) {
        const auto cont = static_cast<uint8_t>(str[pos + i]);
        if (cont < 0x80 || cont > 0xBF) {
            return 0;
        }
    }

    return length;
}

} // namespace

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
    });
    return result;
}

bool isAscii(const std::string& str) {
    return std::all_of(str.begin(), str.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x80;
    });
}

bool isValidUtf8(const std::string& str) {
    size_t pos = 0;
    while (pos < str.size()) {
        size_t length = utf8SequenceLength(str, pos);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}

std::vector<std::string> utf8Characters(const std::string& str) {
    std::vector<std::string> characters;
    characters.reserve(str.size());

    size_t pos = 0;
    while (pos < str.size()) {
        size_t length = utf8SequenceLength(str, pos);
        if (length == 0) {
            length = 1;  // stray byte stands for itself
        }
        characters.push_back(str.substr(pos, length));
        pos += length;
    }

    return characters;
}

bool isStorageSafeChar(char c) {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == '-' || c == '_';
}

bool isStorageSafe(const std::string& str) {
    return std::all_of(str.begin(), str.end(), isStorageSafeChar);
}

std::string sanitizeForStorage(const std::string& str, const std::string& extraAllowed) {
    std::string result;
    result.reserve(str.size());

    for (const auto& ch : utf8Characters(str)) {
        if (ch.size() != 1 || static_cast<unsigned char>(ch[0]) >= 0x80) {
            continue;
        }

        char c = ch[0];
        if (isStorageSafeChar(c) || extraAllowed.find(c) != std::string::npos) {
            result += c;
        } else {
            result += STORAGE_PLACEHOLDER;
        }
    }

    return result;
}

} // namespace utils
} // namespace storagefile
