/**
 * @file local_storage_adapter.h
 * @brief Local filesystem adapter for storage existence checks
 */

#pragma once

#include "storagefile/port/i_storage_existence_port.h"
#include <filesystem>
#include <string>

namespace storagefile::adapter {

/**
 * @brief Local filesystem implementation of the existence port
 *
 * Storage paths are resolved below a base directory. Paths that are
 * absolute or climb out of the base directory never exist.
 */
class LocalStorageAdapter : public port::IStorageExistencePort {
private:
    std::filesystem::path basePath_;

public:
    /**
     * @param basePath Root directory of the storage tree (need not exist yet)
     */
    explicit LocalStorageAdapter(const std::string& basePath);

    /**
     * @throws exception::InfrastructureException STORAGE_ERROR when the
     *         filesystem query itself fails (e.g. permission denied)
     */
    bool exists(const std::string& path) override;

    [[nodiscard]] const std::filesystem::path& getBasePath() const noexcept {
        return basePath_;
    }
};

} // namespace storagefile::adapter
