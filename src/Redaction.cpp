#include "mcp-hub/Redaction.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace mcphub {

namespace {
constexpr std::array<const char *, 6> SENSITIVE_TERMS = {
    "password", "pass", "key", "secret", "token", "auth"};

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool is_flag(const std::string &arg) { return !arg.empty() && arg[0] == '-'; }
} // namespace

bool is_sensitive_name(const std::string &name) {
  std::string lower = to_lower(name);
  for (const char *term : SENSITIVE_TERMS) {
    if (lower.find(term) != std::string::npos) {
      return true;
    }
  }
  return false;
}

LaunchConfig redact(const LaunchConfig &config) {
  LaunchConfig out = config;

  for (auto &[name, value] : out.env) {
    if (is_sensitive_name(name)) {
      value = kRedactedMarker;
    }
  }

  for (size_t i = 0; i < out.args.size(); ++i) {
    const std::string &arg = out.args[i];
    if (!is_flag(arg)) {
      continue;
    }

    auto eq = arg.find('=');
    if (eq != std::string::npos) {
      if (is_sensitive_name(arg.substr(0, eq))) {
        out.args[i] = arg.substr(0, eq + 1) + kRedactedMarker;
      }
      continue;
    }

    if (is_sensitive_name(arg) && i + 1 < out.args.size() &&
        !is_flag(out.args[i + 1])) {
      out.args[i + 1] = kRedactedMarker;
      ++i;
    }
  }

  return out;
}

std::string redacted_command_line(const LaunchConfig &config) {
  LaunchConfig masked = redact(config);
  std::string line = masked.command;
  for (const auto &arg : masked.args) {
    line += " ";
    line += arg;
  }
  return line;
}

} // namespace mcphub
