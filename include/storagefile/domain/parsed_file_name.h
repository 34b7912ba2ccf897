/**
 * @file parsed_file_name.h
 * @brief Value Object for a decomposed stored file name
 */

#pragma once

#include "storagefile/domain/unique_id.h"
#include <string>

namespace storagefile::domain {

/**
 * @brief Stored file name split into display name, identifier and extension
 *
 * Immutable. The display name only holds storage-safe characters and the
 * extension is lowercase without a leading dot; both may be empty.
 */
class ParsedFileName {
private:
    std::string displayName_;
    UniqueId uniqueId_;
    std::string extension_;

    void validate() const;

public:
    /**
     * @throws exception::DomainException INVALID_FILE_NAME when the display
     *         name or extension contains characters outside the storage-safe set
     */
    ParsedFileName(std::string displayName, UniqueId uniqueId, std::string extension);

    [[nodiscard]] const std::string& getDisplayName() const noexcept {
        return displayName_;
    }

    [[nodiscard]] const UniqueId& getUniqueId() const noexcept {
        return uniqueId_;
    }

    [[nodiscard]] const std::string& getExtension() const noexcept {
        return extension_;
    }

    [[nodiscard]] bool hasExtension() const noexcept {
        return !extension_.empty();
    }

    /**
     * @brief Name under which the file is relocated to permanent storage
     *
     * `<displayName>_<uniqueId>.<extension>`, without the dot part when the
     * extension is empty.
     */
    [[nodiscard]] std::string getMovedFileName() const;

    bool operator==(const ParsedFileName& other) const noexcept {
        return displayName_ == other.displayName_ &&
               uniqueId_ == other.uniqueId_ &&
               extension_ == other.extension_;
    }

    bool operator!=(const ParsedFileName& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace storagefile::domain
