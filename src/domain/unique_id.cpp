/**
 * @file unique_id.cpp
 * @brief UniqueId implementation
 */

#include "storagefile/domain/unique_id.h"
#include "storagefile/exception/exceptions.h"
#include "storagefile/utils/string_utils.h"
#include <uuid/uuid.h>

namespace storagefile::domain {

namespace {

bool isHexDigit(char c) {
    return (c >= '0' && c <= '9') ||
           (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
}

bool isHyphenPosition(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

UniqueId::UniqueId(std::string value) : value_(std::move(value)) {}

UniqueId UniqueId::of(const std::string& value) {
    if (!isValid(value)) {
        throw exception::DomainException(
            "INVALID_UNIQUE_ID",
            "Unique identifier must be a canonical UUID: " + value
        );
    }
    return UniqueId(utils::toLower(value));
}

UniqueId UniqueId::generate() {
    uuid_t uuid;
    uuid_generate_random(uuid);

    char str[37];
    uuid_unparse_lower(uuid, str);

    return UniqueId(std::string(str));
}

bool UniqueId::isValid(const std::string& value) {
    return value.length() == LENGTH && matchesAt(value, 0);
}

bool UniqueId::matchesAt(const std::string& text, size_t pos) {
    if (pos > text.length() || text.length() - pos < LENGTH) {
        return false;
    }

    for (size_t i = 0; i < LENGTH; ++i) {
        char c = text[pos + i];
        if (isHyphenPosition(i)) {
            if (c != '-') {
                return false;
            }
        } else if (!isHexDigit(c)) {
            return false;
        }
    }

    return true;
}

std::optional<size_t> UniqueId::findFirst(const std::string& text) {
    if (text.length() < LENGTH) {
        return std::nullopt;
    }

    for (size_t pos = 0; pos + LENGTH <= text.length(); ++pos) {
        if (matchesAt(text, pos)) {
            return pos;
        }
    }

    return std::nullopt;
}

} // namespace storagefile::domain
