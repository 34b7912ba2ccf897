/**
 * @file name_parser.h
 * @brief Decomposition of stored file names
 *
 * Stored uploads are named `<displayName>_<uniqueId>.<extension>`.
 * NameParser recovers the three parts from such a name (or from any string
 * that embeds a UUID-shaped segment) and builds the name for a new upload.
 *
 * All functions are pure and safe to call concurrently.
 */

#pragma once

#include "storagefile/domain/parsed_file_name.h"
#include "storagefile/domain/unique_id.h"
#include <string>

namespace storagefile::parser {

/**
 * @brief Stateless file name parser
 */
class NameParser {
public:
    /// Separator between display name and identifier
    static constexpr char ID_SEPARATOR = '_';

    /**
     * @brief Split a raw file name into display name, identifier and extension
     *
     * Parsing steps:
     * 1. Locate the earliest UUID-shaped segment (case-insensitive).
     * 2. Text before it, minus one trailing '_', is the display candidate.
     * 3. Text after it is the tail. A tail starting with '.' yields everything
     *    after that dot as extension; otherwise the text after the final '.'
     *    is used (empty when the tail has no dot).
     * 4. The display candidate is sanitized with utils::sanitizeForStorage;
     *    the extension likewise (dots kept) and lowercased.
     *
     * @param rawName Candidate file name (any bytes)
     * @return Parsed name
     * @throws exception::MalformedNameException if no UUID-shaped segment exists
     */
    static domain::ParsedFileName parse(const std::string& rawName);

    /**
     * @brief Build the stored name for a freshly uploaded file
     *
     * The original name is split at its final '.': the base name becomes the
     * sanitized display name, the rest the lowercase extension.
     *
     * @param originalName Client supplied file name
     * @param uniqueId Identifier assigned to the upload
     */
    static domain::ParsedFileName compose(const std::string& originalName,
                                          const domain::UniqueId& uniqueId);

    /**
     * @brief Sanitize a display name candidate
     */
    static std::string sanitizeDisplayName(const std::string& candidate);

    /**
     * @brief Sanitize and lowercase an extension (dots kept)
     */
    static std::string sanitizeExtension(const std::string& candidate);
};

} // namespace storagefile::parser
