/**
 * @file unique_id.h
 * @brief Value Object for the unique identifier embedded in stored file names
 *
 * Canonical form is the 36-character hyphenated UUID text in lowercase:
 * xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
 */

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace storagefile::domain {

/**
 * @brief Unique identifier Value Object (canonical UUID text)
 *
 * Any RFC 4122 version is accepted; only the textual shape is checked.
 */
class UniqueId {
private:
    std::string value_;

    explicit UniqueId(std::string value);

public:
    /// Length of the canonical textual form
    static constexpr size_t LENGTH = 36;

    /**
     * @brief Create from UUID text, normalizing hex digits to lowercase
     * @throws exception::DomainException INVALID_UNIQUE_ID if @p value is not UUID-shaped
     */
    static UniqueId of(const std::string& value);

    /**
     * @brief Generate a new random (version 4) identifier
     */
    static UniqueId generate();

    /**
     * @brief Check the 8-4-4-4-12 hex shape (case-insensitive)
     */
    static bool isValid(const std::string& value);

    /**
     * @brief Check that @p text holds a UUID-shaped segment starting at @p pos
     */
    static bool matchesAt(const std::string& text, size_t pos);

    /**
     * @brief Locate the earliest UUID-shaped segment in @p text
     * @return Start offset of the segment, or std::nullopt if there is none
     */
    static std::optional<size_t> findFirst(const std::string& text);

    [[nodiscard]] const std::string& getValue() const noexcept {
        return value_;
    }

    [[nodiscard]] std::string toString() const {
        return value_;
    }

    bool operator==(const UniqueId& other) const noexcept {
        return value_ == other.value_;
    }

    bool operator!=(const UniqueId& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace storagefile::domain

namespace std {
    template<>
    struct hash<storagefile::domain::UniqueId> {
        size_t operator()(const storagefile::domain::UniqueId& id) const {
            return hash<string>()(id.getValue());
        }
    };
}
