/**
 * @file file_validator.cpp
 * @brief FileValidator implementation
 */

#include "storagefile/validation/file_validator.h"
#include "storagefile/exception/exceptions.h"
#include "storagefile/parser/name_parser.h"
#include "storagefile/url/url_recognizer.h"
#include <filesystem>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace storagefile::validation {

// --- ValidatorConfig ---

ValidatorConfig ValidatorConfig::fromConfigManager(const config::ConfigManager& manager) {
    ValidatorConfig result;
    result.tmpDirectory = manager.getString(config::ConfigManager::STORAGE_TMP_DIR, result.tmpDirectory);
    result.validate();
    return result;
}

void ValidatorConfig::validate() const {
    if (tmpDirectory.empty()) {
        throw exception::ConfigException("temporary directory must not be empty");
    }

    std::filesystem::path dir(tmpDirectory);
    if (dir.is_absolute() || dir.has_root_name()) {
        throw exception::ConfigException(
            "temporary directory must be relative to the storage root: " + tmpDirectory);
    }

    for (const auto& part : dir) {
        if (part == "..") {
            throw exception::ConfigException(
                "temporary directory must not leave the storage root: " + tmpDirectory);
        }
    }
}

// --- FileValidator ---

FileValidator::FileValidator(port::IStorageExistencePort* storage, ValidatorConfig config)
    : storage_(storage), config_(std::move(config)) {
    if (!storage_) {
        throw std::invalid_argument("FileValidator requires a storage port");
    }
    config_.validate();

    // Trailing separators would produce "tmp//<uuid>"
    while (config_.tmpDirectory.size() > 1 && config_.tmpDirectory.back() == '/') {
        config_.tmpDirectory.pop_back();
    }
}

bool FileValidator::passes(const std::string& fieldName, const std::string& value) const noexcept {
    return validate(fieldName, value).passed;
}

ValidationOutcome FileValidator::validate(const std::string& fieldName,
                                          const std::string& value) const noexcept {
    try {
        if (url::UrlRecognizer::recognize(value) == url::UrlKind::IS_URL) {
            spdlog::debug("[FileValidator] {}: accepted as URL", fieldName);
            ValidationOutcome outcome = ValidationOutcome::pass();
            outcome.isUrl = true;
            return outcome;
        }

        std::string uniqueId;
        try {
            uniqueId = parser::NameParser::parse(value).getUniqueId().getValue();
        } catch (const exception::MalformedNameException& e) {
            spdlog::debug("[FileValidator] {}: {}", fieldName, e.getMessage());
            return ValidationOutcome::fail(FailureReason::MALFORMED_NAME);
        }

        std::string path = temporaryPathFor(uniqueId);

        ValidationOutcome outcome;
        outcome.temporaryPath = path;

        bool found = false;
        try {
            found = storage_->exists(path);
        } catch (const exception::InfrastructureException& e) {
            spdlog::warn("[FileValidator] {}: storage query for {} failed [{}]: {}",
                         fieldName, path, e.getCode(), e.getMessage());
            outcome.reason = FailureReason::STORAGE_ERROR;
            return outcome;
        } catch (const std::exception& e) {
            spdlog::warn("[FileValidator] {}: storage query for {} failed: {}",
                         fieldName, path, e.what());
            outcome.reason = FailureReason::STORAGE_ERROR;
            return outcome;
        } catch (...) {
            spdlog::warn("[FileValidator] {}: storage query for {} failed: unknown error",
                         fieldName, path);
            outcome.reason = FailureReason::STORAGE_ERROR;
            return outcome;
        }

        if (!found) {
            spdlog::debug("[FileValidator] {}: temporary object {} not found", fieldName, path);
            outcome.reason = FailureReason::TEMPORARY_OBJECT_MISSING;
            return outcome;
        }

        outcome.passed = true;
        return outcome;

    } catch (const std::exception& e) {
        spdlog::warn("[FileValidator] {}: validation failed: {}", fieldName, e.what());
        return ValidationOutcome::fail(FailureReason::INTERNAL_ERROR);
    } catch (...) {
        spdlog::warn("[FileValidator] {}: validation failed: unknown error", fieldName);
        return ValidationOutcome::fail(FailureReason::INTERNAL_ERROR);
    }
}

std::string FileValidator::temporaryPathFor(const std::string& uniqueId) const {
    return config_.tmpDirectory + "/" + uniqueId;
}

std::string FileValidator::message(const std::string& fieldName) {
    return "The " + fieldName + " field must reference an uploaded file or a URL.";
}

} // namespace storagefile::validation
