#include "mcp-hub/Config.hpp"
#include "mcp-hub/server/ProcessRegistry.hpp"
#include "mcp-hub/types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace mcphub {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

int64_t parse_integer(const std::string &name, const std::string &text) {
  try {
    size_t consumed = 0;
    long long value = std::stoll(text, &consumed);
    if (consumed != text.size() || value < 0) {
      throw ConfigError(name + ": expected a non-negative integer, got '" +
                        text + "'");
    }
    return value;
  } catch (const std::logic_error &) {
    throw ConfigError(name + ": expected a non-negative integer, got '" +
                      text + "'");
  }
}

int narrow_integer(const std::string &name, int64_t value) {
  if (value > std::numeric_limits<int>::max()) {
    throw ConfigError(name + " out of range: " + std::to_string(value));
  }
  return static_cast<int>(value);
}

bool parse_bool(const std::string &name, const std::string &text) {
  const std::string v = to_lower(text);
  if (v == "true" || v == "1" || v == "yes") {
    return true;
  }
  if (v == "false" || v == "0" || v == "no") {
    return false;
  }
  throw ConfigError(name + ": expected a boolean, got '" + text + "'");
}

std::vector<std::string> split_list(const std::string &text) {
  std::vector<std::string> items;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto begin = item.find_first_not_of(" \t");
    auto end = item.find_last_not_of(" \t");
    if (begin != std::string::npos) {
      items.push_back(item.substr(begin, end - begin + 1));
    }
  }
  return items;
}

// Scalar at `section.key` as a string, if present
std::optional<std::string> scalar(const YAML::Node &root,
                                  const std::string &section,
                                  const std::string &key) {
  const YAML::Node node = root[section];
  if (!node || !node.IsMap()) {
    return std::nullopt;
  }
  const YAML::Node value = node[key];
  if (!value || value.IsNull()) {
    return std::nullopt;
  }
  if (!value.IsScalar()) {
    throw ConfigError(section + "." + key + ": expected a scalar");
  }
  return value.as<std::string>();
}

} // namespace

size_t parse_size(const std::string &text) {
  std::string v = to_lower(text);
  v.erase(std::remove_if(v.begin(), v.end(),
                         [](unsigned char c) { return std::isspace(c); }),
          v.end());
  size_t multiplier = 1;
  auto ends_with = [&v](const std::string &suffix) {
    return v.size() > suffix.size() &&
           v.compare(v.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  if (ends_with("gb")) {
    multiplier = 1024ull * 1024 * 1024;
    v.resize(v.size() - 2);
  } else if (ends_with("mb")) {
    multiplier = 1024 * 1024;
    v.resize(v.size() - 2);
  } else if (ends_with("kb")) {
    multiplier = 1024;
    v.resize(v.size() - 2);
  } else if (ends_with("b")) {
    v.resize(v.size() - 1);
  }
  return static_cast<size_t>(parse_integer("max_request_size", v)) *
         multiplier;
}

std::optional<std::string> HubConfig::system_env(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (!value) {
    return std::nullopt;
  }
  return std::string(value);
}

HubConfig HubConfig::load(const std::string &yaml_path) {
  return load(yaml_path, &HubConfig::system_env);
}

HubConfig HubConfig::load(const std::string &yaml_path, const EnvLookup &env) {
  HubConfig config;
  if (!yaml_path.empty()) {
    if (!std::filesystem::exists(yaml_path)) {
      throw ConfigError("Config file not found: " + yaml_path);
    }
    try {
      config.apply_yaml(YAML::LoadFile(yaml_path));
    } catch (const YAML::Exception &e) {
      throw ConfigError("Failed to parse " + yaml_path + ": " + e.what());
    }
  }
  config.apply_environment(env);
  config.validate();
  return config;
}

void HubConfig::validate() const {
  if (port <= 0 || port > 65535) {
    throw ConfigError("port out of range: " + std::to_string(port));
  }
  if (sweep_interval.count() == 0 || heartbeat_interval.count() == 0) {
    throw ConfigError("sweep and heartbeat intervals must be positive");
  }
  if (auth_token.empty()) {
    throw ConfigError("auth token must not be empty");
  }
}

void HubConfig::apply_yaml(const YAML::Node &root) {
  if (!root || root.IsNull()) {
    return;
  }
  if (!root.IsMap()) {
    throw ConfigError("Config root must be a mapping");
  }

  if (auto v = scalar(root, "server", "bind_address")) {
    bind_address = *v;
  }
  if (auto v = scalar(root, "server", "port")) {
    port = narrow_integer("server.port", parse_integer("server.port", *v));
  }
  if (auto v = scalar(root, "auth", "token")) {
    auth_token = *v;
  }
  if (auto v = scalar(root, "processes", "default_ttl_minutes")) {
    default_ttl = std::chrono::minutes(
        parse_integer("processes.default_ttl_minutes", *v));
  }
  if (auto v = scalar(root, "processes", "sweep_interval_minutes")) {
    sweep_interval = std::chrono::minutes(
        parse_integer("processes.sweep_interval_minutes", *v));
  }
  if (auto v = scalar(root, "processes", "heartbeat_interval_minutes")) {
    heartbeat_interval = std::chrono::minutes(
        parse_integer("processes.heartbeat_interval_minutes", *v));
  }
  if (auto v = scalar(root, "processes", "handshake_timeout_ms")) {
    handshake_timeout = std::chrono::milliseconds(
        parse_integer("processes.handshake_timeout_ms", *v));
  }
  if (auto v = scalar(root, "processes", "termination_grace_ms")) {
    termination_grace = std::chrono::milliseconds(
        parse_integer("processes.termination_grace_ms", *v));
  }
  if (auto v = scalar(root, "api", "response_timeout_ms")) {
    response_timeout = std::chrono::milliseconds(
        parse_integer("api.response_timeout_ms", *v));
  }
  if (auto v = scalar(root, "api", "run_timeout_ms")) {
    run_timeout =
        std::chrono::milliseconds(parse_integer("api.run_timeout_ms", *v));
  }
  if (auto v = scalar(root, "api", "max_request_size")) {
    max_request_size = parse_size(*v);
  }
  if (auto v = scalar(root, "rate_limit", "max")) {
    rate_limit.max_requests = narrow_integer(
        "rate_limit.max", parse_integer("rate_limit.max", *v));
  }
  if (auto v = scalar(root, "rate_limit", "window_ms")) {
    rate_limit.window =
        std::chrono::milliseconds(parse_integer("rate_limit.window_ms", *v));
  }
  if (auto v = scalar(root, "rate_limit", "strict_max")) {
    strict_rate_limit.max_requests = narrow_integer(
        "rate_limit.strict_max", parse_integer("rate_limit.strict_max", *v));
  }
  if (auto v = scalar(root, "rate_limit", "strict_window_ms")) {
    strict_rate_limit.window = std::chrono::milliseconds(
        parse_integer("rate_limit.strict_window_ms", *v));
  }
  if (auto v = scalar(root, "cors", "enabled")) {
    cors_enabled = parse_bool("cors.enabled", *v);
  }
  if (root["cors"] && root["cors"]["allowed_origins"]) {
    const YAML::Node origins = root["cors"]["allowed_origins"];
    if (origins.IsSequence()) {
      allowed_origins.clear();
      for (const auto &origin : origins) {
        allowed_origins.push_back(origin.as<std::string>());
      }
    } else if (origins.IsScalar()) {
      allowed_origins = split_list(origins.as<std::string>());
    } else {
      throw ConfigError("cors.allowed_origins: expected a list or string");
    }
  }
  if (auto v = scalar(root, "logging", "file")) {
    log_file = *v;
  }
  if (auto v = scalar(root, "logging", "level")) {
    log_level = *v;
  }
}

void HubConfig::apply_environment(const EnvLookup &env) {
  if (!env) {
    return;
  }
  auto number = [&env](const std::string &name) -> std::optional<int64_t> {
    auto v = env(name);
    if (!v || v->empty()) {
      return std::nullopt;
    }
    return parse_integer(name, *v);
  };

  if (auto v = env("BIND_ADDRESS"); v && !v->empty()) {
    bind_address = *v;
  }
  if (auto v = number("PORT")) {
    port = narrow_integer("PORT", *v);
  }
  if (auto v = env("AUTH_TOKEN"); v && !v->empty()) {
    auth_token = *v;
  }
  if (auto v = number("DEFAULT_TTL_MINUTES")) {
    default_ttl = std::chrono::minutes(*v);
  }
  if (auto v = number("SWEEP_INTERVAL_MINUTES")) {
    sweep_interval = std::chrono::minutes(*v);
  }
  if (auto v = number("HEARTBEAT_INTERVAL_MINUTES")) {
    heartbeat_interval = std::chrono::minutes(*v);
  }
  if (auto v = number("HANDSHAKE_TIMEOUT_MS")) {
    handshake_timeout = std::chrono::milliseconds(*v);
  }
  if (auto v = number("TERMINATION_GRACE_MS")) {
    termination_grace = std::chrono::milliseconds(*v);
  }
  if (auto v = number("API_RESPONSE_TIMEOUT_MS")) {
    response_timeout = std::chrono::milliseconds(*v);
  }
  if (auto v = number("API_RUN_TIMEOUT_MS")) {
    run_timeout = std::chrono::milliseconds(*v);
  }
  if (auto v = env("MAX_REQUEST_SIZE"); v && !v->empty()) {
    max_request_size = parse_size(*v);
  }
  if (auto v = number("RATE_LIMIT_MAX")) {
    rate_limit.max_requests = narrow_integer("RATE_LIMIT_MAX", *v);
  }
  if (auto v = number("RATE_LIMIT_WINDOW_MS")) {
    rate_limit.window = std::chrono::milliseconds(*v);
  }
  if (auto v = number("STRICT_RATE_LIMIT_MAX")) {
    strict_rate_limit.max_requests =
        narrow_integer("STRICT_RATE_LIMIT_MAX", *v);
  }
  if (auto v = number("STRICT_RATE_LIMIT_WINDOW_MS")) {
    strict_rate_limit.window = std::chrono::milliseconds(*v);
  }
  if (auto v = env("ENABLE_CORS"); v && !v->empty()) {
    cors_enabled = parse_bool("ENABLE_CORS", *v);
  }
  if (auto v = env("ALLOWED_ORIGINS"); v && !v->empty()) {
    allowed_origins = split_list(*v);
  }
  if (auto v = env("LOG_FILE"); v && !v->empty()) {
    log_file = *v;
  }
  if (auto v = env("LOG_LEVEL"); v && !v->empty()) {
    log_level = *v;
  }
}

server::RegistryOptions HubConfig::registry_options() const {
  server::RegistryOptions options;
  options.default_ttl = default_ttl;
  options.sweep_interval = sweep_interval;
  options.heartbeat_interval = heartbeat_interval;
  options.handshake_timeout = handshake_timeout;
  options.termination_grace = termination_grace;
  return options;
}

} // namespace mcphub
