#pragma once

/**
 * @file logger.hpp
 * @brief Process-wide spdlog facade shared by the viewer core and its hosts
 */

#include <memory>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>
#include <cpptrace/basic.hpp>

namespace rigview::core {

struct LogOptions {
  std::string pattern = "[%H:%M:%S] [%l] %v";
#ifdef DEBUG
  spdlog::level::level_enum level = spdlog::level::debug;
#else
  spdlog::level::level_enum level = spdlog::level::info;
#endif
  // Mirrors console output into this file when set.
  std::optional<std::string> filePath;
  bool console = true;
};

class Logger {
public:
  Logger() = delete;
  ~Logger() = delete;
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // Second and later calls are ignored until shutdown().
  static void init(const LogOptions &options = {});
  static void shutdown();
  static bool isInitialized() { return sLogger != nullptr; }
  static void setLevel(spdlog::level::level_enum level);

  template <typename... Args>
  static void trace(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->trace(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->debug(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void info(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void error(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (sLogger)
      sLogger->error(fmt, std::forward<Args>(args)...);
  }

  // Logs at critical level with the current call stack appended.
  template <typename... Args>
  static void fatal(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    if (!sLogger)
      return;
    const std::string message = fmt::format(fmt, std::forward<Args>(args)...);
    sLogger->critical("{}\n{}", message, cpptrace::generate_trace(1).to_string());
    sLogger->flush();
  }

private:
  static std::shared_ptr<spdlog::logger> sLogger;
};

} // namespace rigview::core
