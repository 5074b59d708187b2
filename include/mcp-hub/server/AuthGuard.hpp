#pragma once
#include "mcp-hub/server/HttpMessage.hpp"

#include <optional>
#include <string>

namespace mcphub {
namespace server {

enum class AuthResult { Ok, Missing, Invalid };

/// Single shared-secret check for the /api routes
class AuthGuard {
public:
  explicit AuthGuard(std::string token) : token_(std::move(token)) {}

  AuthResult check(const HttpRequest &request) const;

  /// Bearer header first, then X-Auth-Token, then ?token=
  static std::optional<std::string> extract_token(const HttpRequest &request);

  /// Comparison whose running time does not depend on where inputs differ
  static bool constant_time_equals(const std::string &a, const std::string &b);

  /// Random alphanumeric token for initial setup
  static std::string generate_token(size_t length = 32);

  /// First 8 characters followed by "..."
  std::string token_prefix() const;

private:
  std::string token_;
};

} // namespace server
} // namespace mcphub
