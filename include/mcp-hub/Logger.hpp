#pragma once
#include "mcp-hub/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>

namespace mcphub {

/// Process-wide logger. Every line is prefixed with a component tag and a
/// subject, usually the "<clientId>:<serverName>" key of a managed process:
///
///   [REGISTRY] [acme:github] Started npx -y @mcp/github (pid 4242)
class MCP_HUB_API HubLogger {
public:
  static HubLogger &instance();

  /// Console sink (info and above) plus a rotating file sink (10 MB x 3).
  /// Calling again only changes the level.
  void init(const std::string &log_file = "mcp_hub.log",
            spdlog::level::level_enum level = spdlog::level::info);

  /// Drop the logger so a later init() recreates the sinks (used by tests)
  void shutdown();

  void set_level(spdlog::level::level_enum level);
  bool should_log(spdlog::level::level_enum level) const;

  /// "trace", "debug", "info", "warn"/"warning", "error"/"err", "off".
  /// Anything else maps to info.
  static spdlog::level::level_enum parse_level(const std::string &name);

  template <typename... Args>
  void trace(const std::string &component, const std::string &subject,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, subject, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &subject,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, subject, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &subject,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, subject, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &subject,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, subject, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &subject,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, subject, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  HubLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &subject, const std::string &fmt_str,
           Args &&...args) {
    if (!should_log(level))
      return;
    write(level, fmt::format("[{}] [{}] {}", component, subject,
                             fmt::format(fmt::runtime(fmt_str),
                                         std::forward<Args>(args)...)));
  }

  void write(spdlog::level::level_enum level, const std::string &line);

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(component, subject, ...)                                     \
  mcphub::HubLogger::instance().trace(component, subject, __VA_ARGS__)
#define LOG_DEBUG(component, subject, ...)                                     \
  mcphub::HubLogger::instance().debug(component, subject, __VA_ARGS__)
#define LOG_INFO(component, subject, ...)                                      \
  mcphub::HubLogger::instance().info(component, subject, __VA_ARGS__)
#define LOG_WARN(component, subject, ...)                                      \
  mcphub::HubLogger::instance().warn(component, subject, __VA_ARGS__)
#define LOG_ERROR(component, subject, ...)                                     \
  mcphub::HubLogger::instance().error(component, subject, __VA_ARGS__)

} // namespace mcphub
