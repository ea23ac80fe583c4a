#include "rigview/core/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace rigview::core {

std::shared_ptr<spdlog::logger> Logger::sLogger;

void Logger::init(const LogOptions &options) {
  if (sLogger) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;
  if (options.console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }

  std::string fileError;
  if (options.filePath) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*options.filePath, true));
    } catch (const spdlog::spdlog_ex &e) {
      fileError = e.what();
    }
  }

  if (sinks.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
  }

  auto logger = std::make_shared<spdlog::logger>("rigview", sinks.begin(), sinks.end());
  logger->set_pattern(options.pattern);
  logger->set_level(options.level);
  logger->flush_on(spdlog::level::warn);

  spdlog::register_logger(logger);
  sLogger = std::move(logger);

  if (!fileError.empty()) {
    warn("Log file {} unavailable: {}", *options.filePath, fileError);
  }
  debug("Logger initialized ({} sinks)", sLogger->sinks().size());
}

void Logger::setLevel(spdlog::level::level_enum level) {
  if (sLogger) {
    sLogger->set_level(level);
  }
}

void Logger::shutdown() {
  if (!sLogger) {
    return;
  }
  sLogger->flush();
  spdlog::drop(sLogger->name());
  sLogger.reset();
}

} // namespace rigview::core
