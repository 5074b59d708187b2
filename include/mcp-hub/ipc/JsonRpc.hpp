#pragma once

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {
namespace ipc {

// Line-delimited JSON-RPC 2.0 as spoken on a child's stdio

inline constexpr const char *PROTOCOL_VERSION = "2024-11-05";
inline constexpr size_t MAX_BUFFERED_OUTPUT = 50 * 1024; // 50 KB

/// Process-wide monotonically increasing request ids. One instance is shared
/// by the handshake, heartbeat and correlated calls so no two in-flight
/// requests ever carry the same id.
class RequestIdGenerator {
public:
  explicit RequestIdGenerator(int64_t first = 1) : next_(first) {}

  int64_t next() { return next_.fetch_add(1); }

private:
  std::atomic<int64_t> next_;
};

std::string build_initialize_request(int64_t id, const std::string &client_name,
                                     const std::string &client_version);
std::string build_initialized_notification();
std::string build_ping(int64_t id);
std::string build_tools_list(int64_t id);
std::string build_tool_call(int64_t id, const std::string &tool,
                            const nlohmann::json &arguments);

/// Terminate a caller-supplied raw request with exactly one newline
std::string ensure_line(const std::string &raw);

/// Parse one trimmed output line as a JSON object. Returns nullopt for blank
/// lines, lines that do not start with '{', and malformed JSON.
std::optional<nlohmann::json> parse_json_line(const std::string &line);

/// True when `message` is a response carrying `id`
bool matches_id(const nlohmann::json &message, int64_t id);

/// Scan newline-separated `output` for the first JSON object, optionally
/// requiring its id to equal `match_id`. First match wins.
std::optional<nlohmann::json>
find_first_json(const std::string &output,
                std::optional<int64_t> match_id = std::nullopt);

/// Accumulates a byte stream and hands back completed lines. The incomplete
/// tail is capped at `max_bytes`; beyond that the oldest bytes are dropped.
class LineBuffer {
public:
  explicit LineBuffer(size_t max_bytes = MAX_BUFFERED_OUTPUT);

  /// Append a chunk and return the lines it completed (without '\n')
  std::vector<std::string> append(const std::string &chunk);

  const std::string &pending() const { return pending_; }
  size_t dropped_bytes() const { return dropped_; }

private:
  size_t max_bytes_;
  std::string pending_;
  size_t dropped_{0};
};

std::string trim(const std::string &s);

} // namespace ipc
} // namespace mcphub
