#pragma once

#include "../transfer/transfer_types.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace nearfetch::storage {

// Local files that can be offered to peers, and the destination of received
// resources.
class FileStore {
public:
    virtual ~FileStore() = default;

    virtual bool exists(const std::string& file_id) = 0;

    virtual std::optional<std::filesystem::path> locate(const std::string& file_id) = 0;

    // Moves a received temporary resource into permanent storage under
    // `name`. Existing files are never overwritten.
    virtual nearfetch::transfer::TransferResult commit(const std::filesystem::path& temp_location,
                                                       const std::string& name,
                                                       std::filesystem::path& location) = 0;
};

} // namespace nearfetch::storage
