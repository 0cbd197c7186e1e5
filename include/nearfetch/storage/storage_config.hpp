#pragma once

#include <filesystem>
#include <string>

namespace nearfetch::core {
class Config;
}

namespace nearfetch::storage {

struct StorageConfig {
    std::filesystem::path download_directory;
    std::filesystem::path incoming_directory;
    std::filesystem::path database_path;

    StorageConfig() = default;

    explicit StorageConfig(const std::filesystem::path& base_dir);

    // Reads storage.base_dir, expanding a leading '~'.
    static StorageConfig from_config(const core::Config& config);

    bool validate() const;

    bool create_directories() const;

    std::filesystem::path get_download_path(const std::string& name) const;

    std::filesystem::path get_incoming_path(const std::string& name) const;

    void set_base_directory(const std::filesystem::path& base_dir);
};

} // namespace nearfetch::storage
