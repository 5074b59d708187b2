#include "mcp-hub/Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace mcphub {

namespace {
constexpr const char *LOGGER_NAME = "mcp-hub";
constexpr size_t MAX_LOG_FILE_SIZE = 10 * 1024 * 1024; // 10 MB
constexpr size_t MAX_LOG_FILES = 3;
} // namespace

// Defined out of line so every module shares one instance
HubLogger &HubLogger::instance() {
  static HubLogger logger;
  return logger;
}

void HubLogger::init(const std::string &log_file,
                     spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (logger_) {
    logger_->set_level(level);
    return;
  }

  try {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, MAX_LOG_FILE_SIZE, MAX_LOG_FILES);
    file_sink->set_level(spdlog::level::trace);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(),
                                               sinks.end());
    logger_->set_level(level);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v");
    // Warnings and errors reach disk immediately; the rest is buffered
    logger_->flush_on(spdlog::level::warn);

    if (!spdlog::get(LOGGER_NAME)) {
      spdlog::register_logger(logger_);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    fmt::print(stderr, "Log initialization failed ({}): {}\n", log_file,
               ex.what());
    logger_.reset();
  }
}

void HubLogger::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (logger_) {
    logger_->flush();
  }
  spdlog::drop(LOGGER_NAME);
  logger_.reset();
}

void HubLogger::set_level(spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (logger_) {
    logger_->set_level(level);
  }
}

bool HubLogger::should_log(spdlog::level::level_enum level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logger_ && logger_->should_log(level);
}

spdlog::level::level_enum HubLogger::parse_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "trace")
    return spdlog::level::trace;
  if (lower == "debug")
    return spdlog::level::debug;
  if (lower == "warn" || lower == "warning")
    return spdlog::level::warn;
  if (lower == "error" || lower == "err")
    return spdlog::level::err;
  if (lower == "off")
    return spdlog::level::off;
  return spdlog::level::info;
}

void HubLogger::write(spdlog::level::level_enum level,
                      const std::string &line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (logger_) {
    logger_->log(level, line);
  }
}

} // namespace mcphub
