#include "mcp-hub/server/AuthGuard.hpp"

#include <algorithm>
#include <random>

namespace mcphub {
namespace server {

namespace {
constexpr const char *BEARER_PREFIX = "Bearer ";
constexpr const char TOKEN_ALPHABET[] =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
} // namespace

std::optional<std::string>
AuthGuard::extract_token(const HttpRequest &request) {
  if (auto auth = request.header("authorization")) {
    const std::string prefix = BEARER_PREFIX;
    if (auth->size() > prefix.size() &&
        auth->compare(0, prefix.size(), prefix) == 0) {
      return auth->substr(prefix.size());
    }
  }
  if (auto token = request.header("x-auth-token"); token && !token->empty()) {
    return token;
  }
  if (auto token = request.query_param("token"); token && !token->empty()) {
    return token;
  }
  return std::nullopt;
}

bool AuthGuard::constant_time_equals(const std::string &a,
                                     const std::string &b) {
  unsigned char diff = a.size() == b.size() ? 0 : 1;
  const size_t n = std::max(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    unsigned char ca = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
    unsigned char cb = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
    diff |= static_cast<unsigned char>(ca ^ cb);
  }
  return diff == 0;
}

AuthResult AuthGuard::check(const HttpRequest &request) const {
  auto token = extract_token(request);
  if (!token) {
    return AuthResult::Missing;
  }
  return constant_time_equals(*token, token_) ? AuthResult::Ok
                                              : AuthResult::Invalid;
}

std::string AuthGuard::generate_token(size_t length) {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<size_t> dist(0, sizeof(TOKEN_ALPHABET) - 2);
  std::string token;
  token.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    token.push_back(TOKEN_ALPHABET[dist(gen)]);
  }
  return token;
}

std::string AuthGuard::token_prefix() const {
  return token_.substr(0, 8) + "...";
}

} // namespace server
} // namespace mcphub
