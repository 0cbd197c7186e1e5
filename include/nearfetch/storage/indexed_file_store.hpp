#pragma once

#include "file_store.hpp"
#include "file_index.hpp"
#include "storage_config.hpp"
#include <mutex>
#include <vector>

namespace nearfetch::storage {

class IndexedFileStore : public FileStore {
public:
    explicit IndexedFileStore(const StorageConfig& config);
    ~IndexedFileStore() override = default;

    bool initialize();

    nearfetch::transfer::TransferResult share_file(const std::string& file_id,
                                                   const std::filesystem::path& path);
    nearfetch::transfer::TransferResult unshare_file(const std::string& file_id);
    std::vector<SharedFile> list_shared_files();
    size_t shared_file_count();

    bool exists(const std::string& file_id) override;
    std::optional<std::filesystem::path> locate(const std::string& file_id) override;
    nearfetch::transfer::TransferResult commit(const std::filesystem::path& temp_location,
                                               const std::string& name,
                                               std::filesystem::path& location) override;

    const StorageConfig& get_config() const { return config_; }

private:
    static bool move_file(const std::filesystem::path& from, const std::filesystem::path& to,
                          std::string& error);

    StorageConfig config_;
    FileIndex index_;
    std::mutex commit_mutex_;
};

} // namespace nearfetch::storage
