#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace castbridge::utils {

enum class LogLevel : std::uint8_t {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  None = 4
};

struct SourceLocation {
  const char* file = "unknown";
  int line = 0;
};

struct LogRecord {
  LogLevel level;
  std::chrono::system_clock::time_point timestamp;
  std::string_view component;
  std::string_view message;
  SourceLocation location;
};

class LogSink {
 public:
  virtual ~LogSink() = default;
  virtual void write(const LogRecord& record) = 0;
};

// Fans records out to its sinks. The level check is lock-free so the logging
// macros can skip building messages nobody will see.
class Logger {
 public:
  explicit Logger(LogLevel min_level = LogLevel::Info);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void set_level(LogLevel level) { m_min_level.store(level, std::memory_order_relaxed); }
  [[nodiscard]] bool enabled(LogLevel level) const {
    return level != LogLevel::None && level >= m_min_level.load(std::memory_order_relaxed);
  }

  void add_sink(std::unique_ptr<LogSink> sink);
  void log(LogLevel level, std::string_view component, std::string_view message,
           SourceLocation location = {});

 private:
  std::atomic<LogLevel> m_min_level;
  std::vector<std::unique_ptr<LogSink>> m_sinks;
  std::mutex m_mutex;
};

// Logs go to stderr so the console keeps stdout for its own output
class ConsoleSink : public LogSink {
 public:
  explicit ConsoleSink(bool use_colors);
  void write(const LogRecord& record) override;

 private:
  bool m_use_colors;
};

// Appends to the file and marks where each run starts; lines carry file:line
class FileSink : public LogSink {
 public:
  explicit FileSink(const std::filesystem::path& path);

  void write(const LogRecord& record) override;
  [[nodiscard]] bool is_open() const { return m_file.is_open(); }

 private:
  std::ofstream m_file;
};

// "[12:04:05.120] [WARN] [Component] message", plus " (file.cpp:42)" when asked
std::string format_record(const LogRecord& record, bool with_location);

// Process-wide logger, replaceable for tests
class LoggerManager {
 public:
  static Logger& get_instance();
  static void set_instance(std::unique_ptr<Logger> logger);

 private:
  static std::unique_ptr<Logger> s_logger;
  static std::mutex s_init_mutex;
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::None: return "none";
    }
    return "info";
}

std::optional<LogLevel> parse_log_level(std::string_view text);

}  // namespace castbridge::utils

#define CASTBRIDGE_LOG_AT(level, component, message)                               \
  do {                                                                             \
    auto& castbridge_logger_ = castbridge::utils::LoggerManager::get_instance();   \
    if (castbridge_logger_.enabled(level)) {                                       \
      castbridge_logger_.log(level, component, message,                            \
                             castbridge::utils::SourceLocation{__FILE__, __LINE__}); \
    }                                                                              \
  } while (0)

#define CASTBRIDGE_LOG_DEBUG(component, message) \
  CASTBRIDGE_LOG_AT(castbridge::utils::LogLevel::Debug, component, message)

#define CASTBRIDGE_LOG_INFO(component, message) \
  CASTBRIDGE_LOG_AT(castbridge::utils::LogLevel::Info, component, message)

#define CASTBRIDGE_LOG_WARNING(component, message) \
  CASTBRIDGE_LOG_AT(castbridge::utils::LogLevel::Warning, component, message)

#define CASTBRIDGE_LOG_ERROR(component, message) \
  CASTBRIDGE_LOG_AT(castbridge::utils::LogLevel::Error, component, message)
