#pragma once
#include "mcp-hub/types.hpp"

#include <string>

namespace mcphub {

/// Marker substituted for sensitive values in reporting output
inline constexpr const char *kRedactedMarker = "[REDACTED]";

/// True when `name` contains (case-insensitive) one of:
/// password, pass, key, secret, token, auth
bool is_sensitive_name(const std::string &name);

/// Copy of `config` with sensitive env values and flag arguments masked.
/// Handles both `--flag value` and `--flag=value` forms.
LaunchConfig redact(const LaunchConfig &config);

/// "command arg1 arg2 ..." built from the redacted config
std::string redacted_command_line(const LaunchConfig &config);

} // namespace mcphub
