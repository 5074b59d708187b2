#pragma once

#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcphub {

/// Launch specification for a child server process
struct LaunchConfig {
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env; // overrides, may be empty

  /// Stable serialization used to detect configuration drift
  std::string fingerprint() const;

  nlohmann::json to_json() const;
  static LaunchConfig from_json(const nlohmann::json &j);
};

/// Thrown when the OS refuses to create a child process
class SpawnError : public std::runtime_error {
public:
  explicit SpawnError(const std::string &message)
      : std::runtime_error(message) {}
};

/// Thrown for unreadable or invalid configuration
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

struct ExitStatus {
  std::optional<int> code;
  std::optional<int> signal;

  std::string describe() const;
};

enum class HealthReason { None, NotFound, Killed, NotInitialized, Zombie };

std::string to_string(HealthReason reason);

struct HealthStatus {
  bool healthy{false};
  HealthReason reason{HealthReason::None};
};

/// Outcome of a single ad hoc JSON-RPC round trip
struct CallResult {
  enum class Outcome { Completed, CommunicationError, ProcessDied };

  Outcome outcome{Outcome::Completed};
  std::string raw_output;
  std::string error_output;
  std::optional<nlohmann::json> parsed_response;
  std::optional<ExitStatus> exit_status; // set when the process died mid-call
  std::string error_message;

  bool ok() const { return outcome == Outcome::Completed; }
  nlohmann::json to_json() const;
};

/// Read-only view of a registry entry, safe to surface to callers
struct ProcessSummary {
  std::string key;
  std::string client_id;
  std::string server_name;
  int pid{0};
  bool initialized{false};
  std::chrono::system_clock::time_point last_accessed_at;
  std::optional<std::chrono::system_clock::time_point> last_heartbeat_at;
  std::chrono::milliseconds ttl{0};
  std::string command_line; // redacted
  nlohmann::json config;    // redacted

  nlohmann::json to_json() const;
};

std::string make_key(const std::string &client_id,
                     const std::string &server_name);

std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace mcphub
