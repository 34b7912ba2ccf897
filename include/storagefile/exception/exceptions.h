/**
 * @file exceptions.h
 * @brief Exception hierarchy for the storage file subsystem
 *
 * Domain errors (bad names, bad identifiers), infrastructure errors
 * (storage backends) and configuration errors each carry a stable code
 * and a human-readable message.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace storagefile::exception {

/**
 * @brief Exception for domain layer errors
 *
 * Used when a value object invariant is broken.
 */
class DomainException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Domain Exception
     * @param code Error code (e.g., "INVALID_UNIQUE_ID")
     * @param message Human-readable error message
     */
    DomainException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

/**
 * @brief No UUID-shaped segment could be located in a file name
 */
class MalformedNameException : public DomainException {
private:
    std::string rawName_;

public:
    explicit MalformedNameException(const std::string& rawName)
        : DomainException("MALFORMED_FILE_NAME",
                          "File name does not contain a unique identifier: " + rawName),
          rawName_(rawName) {}

    /**
     * @brief The rejected input, unmodified
     */
    [[nodiscard]] const std::string& getRawName() const noexcept {
        return rawName_;
    }
};

/**
 * @brief Exception for infrastructure layer errors
 *
 * Used for file system and other storage backend errors.
 */
class InfrastructureException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Infrastructure Exception
     * @param code Error code (e.g., "STORAGE_ERROR")
     * @param message Human-readable error message
     */
    InfrastructureException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

/**
 * @brief Configuration error
 */
class ConfigException : public std::runtime_error {
public:
    explicit ConfigException(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

} // namespace storagefile::exception
