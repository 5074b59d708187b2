#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcphub {
namespace server {

struct HttpRequest {
  std::string method;
  std::string path; // without query string
  std::map<std::string, std::string> query;
  std::map<std::string, std::string> headers; // names lower-cased
  std::string body;
  std::string remote_address;

  std::optional<std::string> header(const std::string &name) const;
  std::optional<std::string> query_param(const std::string &name) const;
};

struct HttpResponse {
  int status{200};
  nlohmann::json body;
  std::vector<std::pair<std::string, std::string>> headers;

  /// Body serialized for the wire; empty for a null body
  std::string serialize_body() const;
};

/// Percent-decoding with '+' as space
std::string url_decode(const std::string &text);

/// "a=1&b=x%20y" -> {a: 1, b: "x y"}. Later duplicates win.
std::map<std::string, std::string> parse_query(const std::string &text);

/// Split "/path?query" and decode the query part into `request`
void parse_target(const std::string &target, HttpRequest &request);

std::string status_text(int status);

} // namespace server
} // namespace mcphub
