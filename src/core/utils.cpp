#include "nearfetch/core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace nearfetch::core::utils {

std::string StringUtils::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();

    if (start >= end) {
        return "";
    }

    return std::string(start, end);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    static const char* const units[] = {"KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    double size = static_cast<double>(bytes) / 1024.0;
    size_t unit = 0;
    for (; size >= 1024.0 && unit + 1 < std::size(units); ++unit) {
        size /= 1024.0;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_percentage(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << std::clamp(fraction, 0.0, 1.0) * 100.0 << "%";
    return oss.str();
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool FileUtils::is_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::optional<size_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::filesystem::path FileUtils::expand_home(const std::string& path) {
    if (path.starts_with("~/") || path == "~") {
        return get_home_dir() / path.substr(std::min<size_t>(2, path.size()));
    }
    return std::filesystem::path(path);
}

std::filesystem::path FileUtils::get_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
    return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

std::filesystem::path FileUtils::unique_path(const std::filesystem::path& desired) {
    if (!exists(desired)) {
        return desired;
    }

    auto directory = desired.parent_path();
    auto stem = desired.stem().string();
    auto extension = desired.extension().string();

    for (int counter = 1;; ++counter) {
        auto candidate = directory / (stem + " (" + std::to_string(counter) + ")" + extension);
        if (!exists(candidate)) {
            return candidate;
        }
    }
}

std::int64_t TimeUtils::unix_seconds(const std::chrono::system_clock::time_point& time) {
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point TimeUtils::from_unix_seconds(std::int64_t seconds) {
    return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
}

}
