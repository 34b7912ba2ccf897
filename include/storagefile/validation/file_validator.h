/**
 * @file file_validator.h
 * @brief Validation rule for file reference field values
 *
 * A file field either holds an absolute URL (trusted as is) or the stored
 * name of an upload parked in temporary storage. For the latter, the name
 * must embed a unique identifier and `<tmpDirectory>/<uniqueId>` must exist.
 *
 * Responsibilities:
 * - URL bypass without storage round-trip
 * - Identifier extraction through parser::NameParser
 * - Exactly one existence query per upload reference
 *
 * Does NOT handle:
 * - Moving files out of temporary storage
 * - Reporting diagnostics to end users (the boolean is the contract)
 */

#pragma once

#include "storagefile/config/config_manager.h"
#include "storagefile/port/i_storage_existence_port.h"
#include <string>

namespace storagefile::validation {

/**
 * @brief Why a value was rejected
 */
enum class FailureReason {
    NONE,
    MALFORMED_NAME,             // no unique identifier in the value
    TEMPORARY_OBJECT_MISSING,   // storage reports the temporary object absent
    STORAGE_ERROR,              // storage query failed, treated as absent
    INTERNAL_ERROR              // unexpected failure outside the storage query
};

/**
 * @brief Convert FailureReason to string
 */
inline std::string toString(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE: return "NONE";
        case FailureReason::MALFORMED_NAME: return "MALFORMED_NAME";
        case FailureReason::TEMPORARY_OBJECT_MISSING: return "TEMPORARY_OBJECT_MISSING";
        case FailureReason::STORAGE_ERROR: return "STORAGE_ERROR";
        case FailureReason::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

/**
 * @brief Result of a single validation attempt
 */
struct ValidationOutcome {
    bool passed = false;
    FailureReason reason = FailureReason::NONE;
    bool isUrl = false;             ///< value accepted as an absolute URL
    std::string temporaryPath;      ///< queried path, empty when none was queried

    static ValidationOutcome pass() {
        ValidationOutcome outcome;
        outcome.passed = true;
        return outcome;
    }

    static ValidationOutcome fail(FailureReason reason) {
        ValidationOutcome outcome;
        outcome.reason = reason;
        return outcome;
    }
};

/**
 * @brief Validator configuration
 */
struct ValidatorConfig {
    std::string tmpDirectory = "tmp";

    /**
     * @brief Read STORAGE_TMP_DIR from configuration
     * @throws exception::ConfigException if the directory is empty, absolute
     *         or contains ".." segments
     */
    static ValidatorConfig fromConfigManager(const config::ConfigManager& manager);

    /**
     * @throws exception::ConfigException on an unusable temporary directory
     */
    void validate() const;
};

/**
 * @brief Checks that a file field value references an acceptable file
 *
 * Holds no per-call state; a single instance may serve concurrent callers
 * as long as the storage port does.
 */
class FileValidator {
public:
    /**
     * @param storage Storage existence port (non-owning, must outlive the validator)
     * @param config Validator configuration
     * @throws exception::ConfigException if @p config is unusable
     */
    explicit FileValidator(port::IStorageExistencePort* storage,
                           ValidatorConfig config = ValidatorConfig());

    /**
     * @brief Decide whether @p value is acceptable for field @p fieldName
     *
     * Never throws; every failure path yields false.
     */
    bool passes(const std::string& fieldName, const std::string& value) const noexcept;

    /**
     * @brief Same decision as passes(), with the reason attached
     */
    ValidationOutcome validate(const std::string& fieldName, const std::string& value) const noexcept;

    /**
     * @brief Temporary storage path for an upload identifier
     */
    std::string temporaryPathFor(const std::string& uniqueId) const;

    /**
     * @brief Message suitable for a form error bag
     */
    static std::string message(const std::string& fieldName);

private:
    port::IStorageExistencePort* storage_;
    ValidatorConfig config_;
};

} // namespace storagefile::validation
