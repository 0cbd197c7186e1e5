#pragma once

#include "../transfer/transfer_types.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace nearfetch::storage {

struct SharedFile {
    std::string file_id;
    std::filesystem::path file_path;
    uint64_t file_size = 0;
    std::chrono::system_clock::time_point added_at;
};

// Persistent mapping from file identifiers to local files.
class FileIndex {
public:
    explicit FileIndex(const std::filesystem::path& db_path);
    ~FileIndex();

    FileIndex(const FileIndex&) = delete;
    FileIndex& operator=(const FileIndex&) = delete;

    bool initialize();
    bool is_open() const;

    bool add_file(const SharedFile& file);

    nearfetch::transfer::TransferResult remove_file(const std::string& file_id);

    std::optional<SharedFile> get_file(const std::string& file_id);

    std::vector<SharedFile> list_files();

    bool file_exists(const std::string& file_id);

    size_t get_file_count();

private:
    bool create_tables();

    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;
};

} // namespace nearfetch::storage
