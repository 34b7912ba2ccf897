/**
 * @file local_storage_adapter.cpp
 * @brief LocalStorageAdapter implementation
 */

#include "storagefile/adapter/local_storage_adapter.h"
#include "storagefile/exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <system_error>

namespace storagefile::adapter {

namespace fs = std::filesystem;

LocalStorageAdapter::LocalStorageAdapter(const std::string& basePath)
    : basePath_(basePath) {}

bool LocalStorageAdapter::exists(const std::string& path) {
    fs::path relative(path);
    if (path.empty() || relative.is_absolute() || relative.has_root_name()) {
        return false;
    }

    for (const auto& part : relative.lexically_normal()) {
        if (part == "..") {
            spdlog::warn("[LocalStorageAdapter] Rejected path outside storage root: {}", path);
            return false;
        }
    }

    fs::path fullPath = basePath_ / relative;

    std::error_code ec;
    bool found = fs::exists(fullPath, ec);
    if (ec) {
        throw exception::InfrastructureException(
            "STORAGE_ERROR",
            "Failed to query " + fullPath.string() + ": " + ec.message()
        );
    }

    return found;
}

} // namespace storagefile::adapter
