#include "castbridge/utils/logger.hpp"

#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace castbridge {
namespace utils {

namespace {
    constexpr std::string_view ANSI_RESET = "\033[0m";

    std::tm local_time(std::chrono::system_clock::time_point tp) {
        const auto time_t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);
        return tm_buf;
    }

    std::string_view level_tag(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::None: break;
        }
        return "-";
    }

    std::string_view level_color(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "\033[36m";
            case LogLevel::Info: return "\033[32m";
            case LogLevel::Warning: return "\033[33m";
            case LogLevel::Error: return "\033[31m";
            case LogLevel::None: break;
        }
        return {};
    }

    std::string_view base_name(const char* path) {
        std::string_view view(path);
        auto pos = view.find_last_of('/');
        return pos == std::string_view::npos ? view : view.substr(pos + 1);
    }
}

std::string format_record(const LogRecord& record, bool with_location) {
    const auto tm = local_time(record.timestamp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm.tm_hour << ":"
        << std::setw(2) << tm.tm_min << ":" << std::setw(2) << tm.tm_sec << "."
        << std::setw(3) << ms.count() << "] "
        << "[" << level_tag(record.level) << "] "
        << "[" << record.component << "] " << record.message;
    if (with_location) {
        oss << " (" << base_name(record.location.file) << ":" << record.location.line << ")";
    }
    return oss.str();
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lower;
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "none" || lower == "off") return LogLevel::None;
    return std::nullopt;
}

Logger::Logger(LogLevel min_level) : m_min_level(min_level) {}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard lock(m_mutex);
    m_sinks.push_back(std::move(sink));
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message,
                 SourceLocation location) {
    if (!enabled(level)) {
        return;
    }
    const LogRecord record{level, std::chrono::system_clock::now(), component, message, location};

    std::lock_guard lock(m_mutex);
    for (auto& sink : m_sinks) {
        sink->write(record);
    }
}

ConsoleSink::ConsoleSink(bool use_colors) : m_use_colors(use_colors) {}

void ConsoleSink::write(const LogRecord& record) {
    if (m_use_colors) {
        std::cerr << level_color(record.level) << format_record(record, false) << ANSI_RESET << '\n';
    } else {
        std::cerr << format_record(record, false) << '\n';
    }
}

FileSink::FileSink(const std::filesystem::path& path) {
    std::error_code ec;
    if (!path.parent_path().empty()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    m_file.open(path, std::ios::out | std::ios::app);
    if (m_file.is_open()) {
        const auto tm = local_time(std::chrono::system_clock::now());
        m_file << "\n=== castbridge started " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " ===\n";
        m_file.flush();
    }
}

void FileSink::write(const LogRecord& record) {
    if (m_file.is_open()) {
        // Flushed per line so the file is complete when the process is killed
        m_file << format_record(record, true) << std::endl;
    }
}

std::unique_ptr<Logger> LoggerManager::s_logger;
std::mutex LoggerManager::s_init_mutex;

Logger& LoggerManager::get_instance() {
    std::lock_guard<std::mutex> lock(s_init_mutex);
    if (!s_logger) {
        s_logger = std::make_unique<Logger>(LogLevel::Info);
        s_logger->add_sink(std::make_unique<ConsoleSink>(false));
    }
    return *s_logger;
}

void LoggerManager::set_instance(std::unique_ptr<Logger> logger) {
    std::lock_guard<std::mutex> lock(s_init_mutex);
    s_logger = std::move(logger);
}

} // namespace utils
} // namespace castbridge
