/**
 * @file i_storage_existence_port.h
 * @brief Port interface for storage existence checks
 */

#pragma once

#include <string>

namespace storagefile::port {

/**
 * @brief Port interface for the storage backend holding temporary uploads
 *
 * Only the existence query is needed by validation. Implementations must
 * be safe to call concurrently; they may throw
 * exception::InfrastructureException on backend failures.
 */
class IStorageExistencePort {
public:
    virtual ~IStorageExistencePort() = default;

    /**
     * @brief Check if an object exists
     * @param path Storage path relative to the backend root (e.g. "tmp/<uuid>")
     * @return true if exists
     */
    virtual bool exists(const std::string& path) = 0;
};

} // namespace storagefile::port
