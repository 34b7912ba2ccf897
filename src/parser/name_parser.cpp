/**
 * @file name_parser.cpp
 * @brief NameParser implementation
 */

#include "storagefile/parser/name_parser.h"
#include "storagefile/exception/exceptions.h"
#include "storagefile/utils/string_utils.h"

namespace storagefile::parser {

using domain::ParsedFileName;
using domain::UniqueId;

namespace {

std::string extensionFromTail(const std::string& tail) {
    if (tail.empty()) {
        return "";
    }

    if (tail.front() == '.') {
        return tail.substr(1);
    }

    size_t dotPos = tail.rfind('.');
    if (dotPos == std::string::npos) {
        return "";
    }
    return tail.substr(dotPos + 1);
}

// Break every UUID-shaped segment so only the appended identifier can match
std::string neutralizeIdentifiers(std::string text) {
    while (auto pos = UniqueId::findFirst(text)) {
        for (size_t i = *pos; i < *pos + UniqueId::LENGTH; ++i) {
            if (text[i] == '-') {
                text[i] = utils::STORAGE_PLACEHOLDER;
            }
        }
    }
    return text;
}

} // namespace

ParsedFileName NameParser::parse(const std::string& rawName) {
    auto idPos = UniqueId::findFirst(rawName);
    if (!idPos) {
        throw exception::MalformedNameException(rawName);
    }

    std::string candidate = rawName.substr(0, *idPos);
    if (!candidate.empty() && candidate.back() == ID_SEPARATOR) {
        candidate.pop_back();
    }

    auto uniqueId = UniqueId::of(rawName.substr(*idPos, UniqueId::LENGTH));
    std::string tail = rawName.substr(*idPos + UniqueId::LENGTH);

    return ParsedFileName(
        sanitizeDisplayName(candidate),
        std::move(uniqueId),
        sanitizeExtension(extensionFromTail(tail))
    );
}

ParsedFileName NameParser::compose(const std::string& originalName, const UniqueId& uniqueId) {
    std::string baseName = originalName;
    std::string extension;

    size_t dotPos = originalName.rfind('.');
    if (dotPos != std::string::npos) {
        baseName = originalName.substr(0, dotPos);
        extension = originalName.substr(dotPos + 1);
    }

    return ParsedFileName(
        neutralizeIdentifiers(sanitizeDisplayName(baseName)),
        uniqueId,
        sanitizeExtension(extension)
    );
}

std::string NameParser::sanitizeDisplayName(const std::string& candidate) {
    return utils::sanitizeForStorage(candidate);
}

std::string NameParser::sanitizeExtension(const std::string& candidate) {
    return utils::toLower(utils::sanitizeForStorage(candidate, "."));
}

} // namespace storagefile::parser
