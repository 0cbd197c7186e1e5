#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace nearfetch::core {

// Flat `section.key=value` settings. Lines starting with '#' are comments.
class Config {
public:
    Config() = default;

    static Config& instance();

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool has(const std::string& key) const { return values_.count(key) > 0; }
    bool erase(const std::string& key) { return values_.erase(key) > 0; }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // Milliseconds; negative or malformed values fall back to the default.
    std::chrono::milliseconds get_duration(const std::string& key, std::chrono::milliseconds default_value) const;
    // Expands a leading '~'.
    std::filesystem::path get_path(const std::string& key, const std::filesystem::path& default_value) const;

    const std::map<std::string, std::string>& values() const { return values_; }

    void set_defaults();
    void clear() { values_.clear(); }

private:
    std::map<std::string, std::string> values_;
};

}
