#include "nearfetch/storage/indexed_file_store.hpp"
#include "nearfetch/core/logger.hpp"
#include "nearfetch/core/utils.hpp"

namespace nearfetch::storage {

using nearfetch::transfer::TransferError;
using nearfetch::transfer::TransferResult;
using nearfetch::core::utils::FileUtils;

IndexedFileStore::IndexedFileStore(const StorageConfig& config)
    : config_(config)
    , index_(config.database_path) {
}

bool IndexedFileStore::initialize() {
    if (!config_.validate()) {
        LOG_ERROR("Invalid storage configuration");
        return false;
    }

    if (!config_.create_directories()) {
        LOG_ERROR("Failed to create storage directories under {}",
                  config_.download_directory.parent_path().string());
        return false;
    }

    if (!index_.initialize()) {
        return false;
    }

    LOG_INFO("File store ready at {}, {} shared files", config_.download_directory.parent_path().string(),
             index_.get_file_count());
    return true;
}

TransferResult IndexedFileStore::share_file(const std::string& file_id, const std::filesystem::path& path) {
    if (file_id.empty()) {
        return TransferResult(TransferError::FILE_UNAVAILABLE, "Empty file identifier");
    }

    if (!FileUtils::is_file(path)) {
        return TransferResult(TransferError::FILE_UNAVAILABLE, "Not a regular file: " + path.string());
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return TransferResult(TransferError::FILE_UNAVAILABLE, ec.message());
    }

    SharedFile file;
    file.file_id = file_id;
    file.file_path = absolute.lexically_normal();
    file.file_size = FileUtils::file_size(absolute).value_or(0);
    file.added_at = std::chrono::system_clock::now();

    if (!index_.add_file(file)) {
        return TransferResult(TransferError::FILE_UNAVAILABLE, "Failed to index " + file_id);
    }

    LOG_INFO("Sharing {} as {} ({})", file.file_path.string(), file_id,
             core::utils::StringUtils::format_bytes(file.file_size));
    return TransferResult(TransferError::SUCCESS);
}

TransferResult IndexedFileStore::unshare_file(const std::string& file_id) {
    return index_.remove_file(file_id);
}

std::vector<SharedFile> IndexedFileStore::list_shared_files() {
    return index_.list_files();
}

size_t IndexedFileStore::shared_file_count() {
    return index_.get_file_count();
}

bool IndexedFileStore::exists(const std::string& file_id) {
    return locate(file_id).has_value();
}

std::optional<std::filesystem::path> IndexedFileStore::locate(const std::string& file_id) {
    auto file = index_.get_file(file_id);
    if (!file) {
        return std::nullopt;
    }

    if (!FileUtils::is_file(file->file_path)) {
        LOG_WARN("Indexed file {} is missing at {}", file_id, file->file_path.string());
        return std::nullopt;
    }
    return file->file_path;
}

TransferResult IndexedFileStore::commit(const std::filesystem::path& temp_location,
                                        const std::string& name,
                                        std::filesystem::path& location) {
    auto file_name = std::filesystem::path(name).filename();
    if (file_name.empty() || file_name == "." || file_name == "..") {
        return TransferResult(TransferError::STORAGE_COMMIT_FAILED, "Invalid resource name: " + name);
    }

    if (!FileUtils::is_file(temp_location)) {
        return TransferResult(TransferError::STORAGE_COMMIT_FAILED,
                              "Received resource missing: " + temp_location.string());
    }

    if (!FileUtils::create_directories(config_.download_directory)) {
        return TransferResult(TransferError::STORAGE_COMMIT_FAILED,
                              "Cannot create " + config_.download_directory.string());
    }

    std::filesystem::path target;
    {
        std::lock_guard<std::mutex> lock(commit_mutex_);
        target = FileUtils::unique_path(config_.get_download_path(file_name.string()));

        std::string error;
        if (!move_file(temp_location, target, error)) {
            LOG_ERROR("Failed to commit {} to {}: {}", temp_location.string(), target.string(), error);
            return TransferResult(TransferError::STORAGE_COMMIT_FAILED, error);
        }
    }

    SharedFile file;
    file.file_id = name;
    file.file_path = target;
    file.file_size = FileUtils::file_size(target).value_or(0);
    file.added_at = std::chrono::system_clock::now();
    if (!index_.add_file(file)) {
        LOG_WARN("Committed {} but could not index it", target.string());
    }

    LOG_INFO("Committed {} to {}", name, target.string());
    location = target;
    return TransferResult::ok(target);
}

bool IndexedFileStore::move_file(const std::filesystem::path& from, const std::filesystem::path& to,
                                 std::string& error) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return true;
    }

    // Different file systems
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::none, ec);
    if (ec) {
        error = ec.message();
        return false;
    }

    std::filesystem::remove(from, ec);
    if (ec) {
        LOG_WARN("Could not remove {} after copy: {}", from.string(), ec.message());
    }
    return true;
}

} // namespace nearfetch::storage
