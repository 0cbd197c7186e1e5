#include "nearfetch/core/logger.hpp"
#include "nearfetch/core/utils.hpp"
#include <filesystem>
#include <vector>

namespace nearfetch::core {

namespace {

constexpr std::size_t MAX_LOG_FILE_SIZE = 5 * 1024 * 1024;
constexpr std::size_t MAX_LOG_FILES = 3;

spdlog::level::level_enum to_spdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}

std::shared_ptr<spdlog::logger> Logger::logger_;

LogLevel parse_log_level(const std::string& name, LogLevel default_level) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(name));

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;

    return default_level;
}

// An empty log_file logs to the console only. Calling this again replaces the
// previous logger.
void Logger::initialize(const std::string& log_file, LogLevel level) {
    if (logger_) {
        shutdown();
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(to_spdlog(level));
    console->set_pattern("%H:%M:%S.%e %^%-5l%$ %v");
    sinks.push_back(console);

    if (!log_file.empty()) {
        auto parent = std::filesystem::path(log_file).parent_path();
        if (!parent.empty()) {
            utils::FileUtils::create_directories(parent);
        }

        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, MAX_LOG_FILE_SIZE, MAX_LOG_FILES);
        file->set_level(spdlog::level::trace);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] [%s:%#] %v");
        sinks.push_back(file);
    }

    logger_ = std::make_shared<spdlog::logger>("nearfetch", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog(level));
    logger_->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger_);

    LOG_DEBUG("Logging at {} to {}", spdlog::level::to_string_view(to_spdlog(level)),
              log_file.empty() ? std::string("console") : log_file);
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }

    logger_->flush();
    spdlog::shutdown();
    logger_.reset();
}

}
