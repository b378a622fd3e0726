#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace genomemem {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) {
    switch (level) {
      case LogLevel::DEBUG:
        spdlog::set_level(spdlog::level::debug);
        break;
      case LogLevel::INFO:
        spdlog::set_level(spdlog::level::info);
        break;
      case LogLevel::WARN:
        spdlog::set_level(spdlog::level::warn);
        break;
      case LogLevel::ERROR:
        spdlog::set_level(spdlog::level::err);
        break;
    }
  }

  LogLevel getLevel() const {
    switch (spdlog::get_level()) {
      case spdlog::level::trace:
      case spdlog::level::debug:
        return LogLevel::DEBUG;
      case spdlog::level::warn:
        return LogLevel::WARN;
      case spdlog::level::err:
      case spdlog::level::critical:
        return LogLevel::ERROR;
      default:
        return LogLevel::INFO;
    }
  }

  void setLogToFile(const std::string& filename) {
    try {
      auto file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true);
      auto file_logger =
          std::make_shared<spdlog::logger>("genomemem_file", file_sink);
      spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
      spdlog::error("Log initialization failed: {}", ex.what());
    }
  }

  template <typename... Args>
  void log(spdlog::level::level_enum level,
           const std::source_location& location,
           spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if (!spdlog::should_log(level)) {
      return;
    }
    // Strip the directory, keep the file name
    std::string_view path(location.file_name());
    size_t pos = path.find_last_of("/\\");
    std::string_view filename =
        (pos == std::string_view::npos) ? path : path.substr(pos + 1);

    std::string message =
        spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...);
    spdlog::log(level, "{} [{}:{}]", message, filename, location.line());
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

 private:
  Logger() { spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v"); }
};

// Format-string helpers. The source location is captured at the call site
// through a defaulted argument of the wrapper struct below.
template <typename... Args>
struct LogFormat {
  template <typename S>
  consteval LogFormat(
      const S& s,
      const std::source_location& loc = std::source_location::current())
      : fmt(s), location(loc) {}

  spdlog::format_string_t<Args...> fmt;
  std::source_location location;
};

template <typename... Args>
inline void log_debug(LogFormat<std::type_identity_t<Args>...> fmt,
                      Args&&... args) {
  Logger::getInstance().log(spdlog::level::debug, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_info(LogFormat<std::type_identity_t<Args>...> fmt,
                     Args&&... args) {
  Logger::getInstance().log(spdlog::level::info, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_warn(LogFormat<std::type_identity_t<Args>...> fmt,
                     Args&&... args) {
  Logger::getInstance().log(spdlog::level::warn, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_error(LogFormat<std::type_identity_t<Args>...> fmt,
                      Args&&... args) {
  Logger::getInstance().log(spdlog::level::err, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

// Prefixes every message with a component name, e.g. "PooledArena[4096]"
class ContextLogger {
 public:
  explicit ContextLogger(std::string prefix) : prefix_(std::move(prefix)) {}

  template <typename... Args>
  void debug(LogFormat<std::type_identity_t<Args>...> fmt,
             Args&&... args) const {
    emit(spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(LogFormat<std::type_identity_t<Args>...> fmt,
            Args&&... args) const {
    emit(spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(LogFormat<std::type_identity_t<Args>...> fmt,
            Args&&... args) const {
    emit(spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(LogFormat<std::type_identity_t<Args>...> fmt,
             Args&&... args) const {
    emit(spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  const std::string& prefix() const { return prefix_; }

 private:
  template <typename... Args>
  void emit(spdlog::level::level_enum level,
            const LogFormat<std::type_identity_t<Args>...>& fmt,
            Args&&... args) const {
    if (!spdlog::should_log(level)) return;
    Logger::getInstance().log(
        level, fmt.location, "{}: {}", prefix_,
        spdlog::fmt_lib::format(fmt.fmt, std::forward<Args>(args)...));
  }

  std::string prefix_;
};

}  // namespace genomemem

#endif  // LOGGER_HPP
