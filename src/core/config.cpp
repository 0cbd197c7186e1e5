#include "nearfetch/core/config.hpp"
#include "nearfetch/core/logger.hpp"
#include "nearfetch/core/utils.hpp"
#include <charconv>
#include <fstream>
#include <utility>

namespace nearfetch::core {

namespace {

const std::pair<const char*, const char*> DEFAULT_SETTINGS[] = {
    {"transfer.scheduler_interval_ms", "5000"},
    {"transfer.accept_timeout_ms", "45000"},
    {"transfer.invite_timeout_ms", "30000"},
    {"upload.auto_accept", "false"},
    {"storage.base_dir", "./nearfetch_data"},
    {"peer.name", "nearfetch"},
    {"log.level", "info"},
    {"log.file", "nearfetch.log"},
    {"demo.chunk_delay_ms", "2"},
};

std::string section_of(const std::string& key) {
    auto dot = key.find('.');
    return dot == std::string::npos ? std::string() : key.substr(0, dot);
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = utils::StringUtils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto separator = line.find('=');
        std::string key = separator == std::string::npos ? "" : utils::StringUtils::trim(line.substr(0, separator));
        if (key.empty()) {
            LOG_WARN("{}:{}: expected key=value, skipping", filename, line_number);
            continue;
        }

        values_[key] = utils::StringUtils::trim(line.substr(separator + 1));
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# nearfetch configuration\n";

    std::string current_section;
    bool first = true;
    for (const auto& [key, value] : values_) {
        auto section = section_of(key);
        if (first || section != current_section) {
            file << "\n";
            if (!section.empty()) {
                file << "# " << section << "\n";
            }
            current_section = section;
            first = false;
        }
        file << key << "=" << value << "\n";
    }

    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = utils::StringUtils::to_lower(*value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get(key);
    if (!value || value->empty()) return default_value;

    int result = 0;
    const char* end = value->data() + value->size();
    auto [ptr, ec] = std::from_chars(value->data(), end, result);
    if (ec != std::errc() || ptr != end) {
        return default_value;
    }
    return result;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

std::chrono::milliseconds Config::get_duration(const std::string& key, std::chrono::milliseconds default_value) const {
    int value = get_int(key, -1);
    if (value < 0) {
        return default_value;
    }
    return std::chrono::milliseconds(value);
}

std::filesystem::path Config::get_path(const std::string& key, const std::filesystem::path& default_value) const {
    auto value = get(key);
    if (!value || value->empty()) {
        return utils::FileUtils::expand_home(default_value.string());
    }
    return utils::FileUtils::expand_home(*value);
}

void Config::set_defaults() {
    for (const auto& [key, value] : DEFAULT_SETTINGS) {
        values_[key] = value;
    }
}

}
