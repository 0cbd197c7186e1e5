#include "nearfetch/storage/storage_config.hpp"
#include "nearfetch/core/config.hpp"
#include "nearfetch/core/logger.hpp"

namespace nearfetch::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

StorageConfig StorageConfig::from_config(const core::Config& config) {
    return StorageConfig(config.get_path("storage.base_dir", "./nearfetch_data"));
}

bool StorageConfig::validate() const {
    if (download_directory.empty() || incoming_directory.empty() || database_path.empty()) {
        return false;
    }

    // Received resources are moved, not copied, into the download directory
    if (download_directory == incoming_directory) {
        return false;
    }

    return true;
}

bool StorageConfig::create_directories() const {
    for (const auto& dir : {download_directory, incoming_directory, database_path.parent_path()}) {
        if (dir.empty()) {
            continue;
        }
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            LOG_ERROR("Cannot create storage directory {}: {}", dir.string(), ec.message());
            return false;
        }
    }
    return true;
}

std::filesystem::path StorageConfig::get_download_path(const std::string& name) const {
    return download_directory / std::filesystem::path(name).filename();
}

std::filesystem::path StorageConfig::get_incoming_path(const std::string& name) const {
    return incoming_directory / std::filesystem::path(name).filename();
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    download_directory = base_dir / "downloads";
    incoming_directory = base_dir / "incoming";
    database_path = base_dir / "nearfetch.db";
}

} // namespace nearfetch::storage
