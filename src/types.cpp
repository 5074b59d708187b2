#include "mcp-hub/types.hpp"
#include "mcp-hub/Redaction.hpp"

#include <cmath>
#include <ctime>
#include <fmt/format.h>

namespace mcphub {

std::string LaunchConfig::fingerprint() const {
  // nlohmann::json objects keep keys sorted, so dump() is canonical
  return to_json().dump();
}

nlohmann::json LaunchConfig::to_json() const {
  nlohmann::json j;
  j["command"] = command;
  j["args"] = args;
  if (!env.empty()) {
    j["env"] = env;
  }
  return j;
}

LaunchConfig LaunchConfig::from_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::invalid_argument("config must be an object");
  }
  if (!j.contains("command") || !j["command"].is_string() ||
      j["command"].get<std::string>().empty()) {
    throw std::invalid_argument("config.command must be a non-empty string");
  }
  if (!j.contains("args") || !j["args"].is_array()) {
    throw std::invalid_argument("config.args must be an array of strings");
  }

  LaunchConfig config;
  config.command = j["command"].get<std::string>();
  for (const auto &arg : j["args"]) {
    if (!arg.is_string()) {
      throw std::invalid_argument("config.args must be an array of strings");
    }
    config.args.push_back(arg.get<std::string>());
  }

  if (j.contains("env") && !j["env"].is_null()) {
    if (!j["env"].is_object()) {
      throw std::invalid_argument("config.env must be an object");
    }
    for (const auto &[name, value] : j["env"].items()) {
      config.env[name] = value.is_string() ? value.get<std::string>()
                                           : value.dump();
    }
  }
  return config;
}

std::string ExitStatus::describe() const {
  if (signal) {
    return fmt::format("signal {}", *signal);
  }
  if (code) {
    return fmt::format("exit code {}", *code);
  }
  return "unknown exit status";
}

std::string to_string(HealthReason reason) {
  switch (reason) {
  case HealthReason::None:
    return "";
  case HealthReason::NotFound:
    return "not-found";
  case HealthReason::Killed:
    return "killed";
  case HealthReason::NotInitialized:
    return "not-initialized";
  case HealthReason::Zombie:
    return "zombie";
  }
  return "unknown";
}

nlohmann::json CallResult::to_json() const {
  nlohmann::json j;
  j["rawOutput"] = raw_output;
  j["errorOutput"] = error_output;
  j["parsedResponse"] =
      parsed_response ? *parsed_response : nlohmann::json(nullptr);
  return j;
}

nlohmann::json ProcessSummary::to_json() const {
  nlohmann::json j;
  j["uniqueKey"] = key;
  j["clientId"] = client_id;
  j["MCPServerName"] = server_name;
  j["pid"] = pid;
  j["initialized"] = initialized;
  j["lastHit"] = format_timestamp(last_accessed_at);
  j["lastHeartbeat"] = last_heartbeat_at
                           ? nlohmann::json(format_timestamp(*last_heartbeat_at))
                           : nlohmann::json(nullptr);
  j["ttlMinutes"] = static_cast<int64_t>(
      std::llround(static_cast<double>(ttl.count()) / 60000.0));
  j["command"] = command_line;
  j["config"] = config;
  return j;
}

std::string make_key(const std::string &client_id,
                     const std::string &server_name) {
  return client_id + ":" + server_name;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch())
                .count();
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm tm_utc{};
  gmtime_r(&secs, &tm_utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
  return fmt::format("{}.{:03d}Z", buf, static_cast<int>(ms % 1000));
}

} // namespace mcphub
