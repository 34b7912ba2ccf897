/**
 * @file parsed_file_name.cpp
 * @brief ParsedFileName implementation
 */

#include "storagefile/domain/parsed_file_name.h"
#include "storagefile/exception/exceptions.h"
#include "storagefile/utils/string_utils.h"
#include <algorithm>

namespace storagefile::domain {

ParsedFileName::ParsedFileName(std::string displayName, UniqueId uniqueId, std::string extension)
    : displayName_(std::move(displayName)),
      uniqueId_(std::move(uniqueId)),
      extension_(std::move(extension)) {
    validate();
}

void ParsedFileName::validate() const {
    if (!utils::isStorageSafe(displayName_)) {
        throw exception::DomainException(
            "INVALID_FILE_NAME",
            "Display name contains characters outside the storage-safe set: " + displayName_
        );
    }

    bool extensionSafe = std::all_of(extension_.begin(), extension_.end(), [](char c) {
        return (utils::isStorageSafeChar(c) && !(c >= 'A' && c <= 'Z')) || c == '.';
    });
    if (!extensionSafe) {
        throw exception::DomainException(
            "INVALID_FILE_NAME",
            "Extension must be lowercase storage-safe text: " + extension_
        );
    }
}

std::string ParsedFileName::getMovedFileName() const {
    std::string moved;
    moved.reserve(displayName_.size() + UniqueId::LENGTH + extension_.size() + 2);

    moved += displayName_;
    moved += '_';
    moved += uniqueId_.getValue();

    if (!extension_.empty()) {
        moved += '.';
        moved += extension_;
    }

    return moved;
}

} // namespace storagefile::domain
