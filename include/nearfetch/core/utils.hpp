#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <chrono>
#include <cstdint>

namespace nearfetch::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    // "512 B", "1.5 KiB", "3.2 GiB"
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_percentage(double fraction);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<size_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::filesystem::path expand_home(const std::string& path);
    static std::filesystem::path get_home_dir();

    // First "<stem> (n)<ext>" in the directory that does not exist yet.
    static std::filesystem::path unique_path(const std::filesystem::path& desired);
};

class TimeUtils {
public:
    static std::int64_t unix_seconds(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_unix_seconds(std::int64_t seconds);
};

}
