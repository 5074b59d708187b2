#include "mcp-hub/ipc/JsonRpc.hpp"

#include <cctype>
#include <sstream>

using json = nlohmann::json;

namespace mcphub {
namespace ipc {

std::string build_initialize_request(int64_t id, const std::string &client_name,
                                     const std::string &client_version) {
  json msg = {{"jsonrpc", "2.0"},
              {"id", id},
              {"method", "initialize"},
              {"params",
               {{"protocolVersion", PROTOCOL_VERSION},
                {"capabilities",
                 {{"roots", {{"listChanged", true}}},
                  {"sampling", json::object()}}},
                {"clientInfo",
                 {{"name", client_name}, {"version", client_version}}}}}};
  return msg.dump() + "\n";
}

std::string build_initialized_notification() {
  json msg = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
  return msg.dump() + "\n";
}

std::string build_ping(int64_t id) {
  json msg = {{"jsonrpc", "2.0"},
              {"id", id},
              {"method", "ping"},
              {"params", json::object()}};
  return msg.dump() + "\n";
}

std::string build_tools_list(int64_t id) {
  json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/list"}};
  return msg.dump() + "\n";
}

std::string build_tool_call(int64_t id, const std::string &tool,
                            const json &arguments) {
  json msg = {{"jsonrpc", "2.0"},
              {"id", id},
              {"method", "tools/call"},
              {"params",
               {{"name", tool},
                {"arguments",
                 arguments.is_null() ? json::object() : arguments}}}};
  return msg.dump() + "\n";
}

std::string ensure_line(const std::string &raw) {
  if (!raw.empty() && raw.back() == '\n') {
    return raw;
  }
  return raw + "\n";
}

std::string trim(const std::string &s) {
  size_t begin = 0;
  while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin])))
    ++begin;
  size_t end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(begin, end - begin);
}

std::optional<json> parse_json_line(const std::string &line) {
  std::string trimmed = trim(line);
  if (trimmed.empty() || trimmed.front() != '{') {
    return std::nullopt;
  }
  json parsed = json::parse(trimmed, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}

bool matches_id(const json &message, int64_t id) {
  auto it = message.find("id");
  if (it == message.end() || !it->is_number_integer()) {
    return false;
  }
  return it->get<int64_t>() == id;
}

std::optional<json> find_first_json(const std::string &output,
                                    std::optional<int64_t> match_id) {
  std::istringstream stream(output);
  std::string line;
  while (std::getline(stream, line)) {
    auto parsed = parse_json_line(line);
    if (!parsed) {
      continue;
    }
    if (match_id && !matches_id(*parsed, *match_id)) {
      continue;
    }
    return parsed;
  }
  return std::nullopt;
}

LineBuffer::LineBuffer(size_t max_bytes) : max_bytes_(max_bytes) {}

std::vector<std::string> LineBuffer::append(const std::string &chunk) {
  std::vector<std::string> lines;
  pending_ += chunk;

  size_t start = 0;
  size_t pos;
  while ((pos = pending_.find('\n', start)) != std::string::npos) {
    std::string line = pending_.substr(start, pos - start);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines.push_back(std::move(line));
    start = pos + 1;
  }
  pending_.erase(0, start);

  if (pending_.size() > max_bytes_) {
    size_t excess = pending_.size() - max_bytes_;
    pending_.erase(0, excess);
    dropped_ += excess;
  }
  return lines;
}

} // namespace ipc
} // namespace mcphub
