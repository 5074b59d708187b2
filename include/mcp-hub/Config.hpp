#pragma once
#include "mcp-hub/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace mcphub {
namespace server {
struct RegistryOptions;
}

struct RateLimitSettings {
  int max_requests{100};
  std::chrono::milliseconds window{900000};
};

/// Service settings. Precedence: defaults, YAML file, environment, CLI flags.
struct HubConfig {
  using EnvLookup =
      std::function<std::optional<std::string>(const std::string &name)>;

  std::string bind_address{"0.0.0.0"};
  int port{4000};
  std::string auth_token{"demo-token-32-chars-1234567890ab"};

  std::chrono::minutes default_ttl{15};
  std::chrono::minutes sweep_interval{1};
  std::chrono::minutes heartbeat_interval{5};
  std::chrono::milliseconds handshake_timeout{30000};
  std::chrono::milliseconds termination_grace{8000};

  std::chrono::milliseconds response_timeout{3000};
  std::chrono::milliseconds run_timeout{5000};
  size_t max_request_size{10 * 1024 * 1024};

  RateLimitSettings rate_limit{100, std::chrono::milliseconds(900000)};
  RateLimitSettings strict_rate_limit{20, std::chrono::milliseconds(300000)};

  bool cors_enabled{true};
  std::vector<std::string> allowed_origins{"*"};

  std::string log_file{"mcp_hub.log"};
  std::string log_level{"info"};

  /// Defaults, then `yaml_path` if non-empty, then the environment.
  /// Throws ConfigError.
  static HubConfig load(const std::string &yaml_path, const EnvLookup &env);
  static HubConfig load(const std::string &yaml_path);

  void apply_yaml(const YAML::Node &root);
  void apply_environment(const EnvLookup &env);

  /// Throws ConfigError for out-of-range values
  void validate() const;

  server::RegistryOptions registry_options() const;

  /// Process environment lookup
  static std::optional<std::string> system_env(const std::string &name);
};

/// "10mb", "512kb", "1gb", "2048" -> bytes. Throws ConfigError.
size_t parse_size(const std::string &text);

} // namespace mcphub
