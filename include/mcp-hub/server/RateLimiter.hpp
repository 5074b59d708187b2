#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace mcphub {
namespace server {

struct RateDecision {
  bool allowed{true};
  int remaining{0};
  std::chrono::seconds retry_after{0};
};

/// Fixed-window request counter keyed by client address
class RateLimiter {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  RateLimiter(int max_requests, std::chrono::milliseconds window,
              Clock clock = [] { return std::chrono::steady_clock::now(); });

  /// Count one request from `client` and decide whether it may proceed
  RateDecision check(const std::string &client);

  /// Forget windows that have already ended
  void prune();

  int max_requests() const { return max_requests_; }
  std::chrono::milliseconds window() const { return window_; }

private:
  struct Window {
    std::chrono::steady_clock::time_point started;
    int count{0};
  };

  int max_requests_;
  std::chrono::milliseconds window_;
  Clock clock_;
  std::mutex mutex_;
  std::map<std::string, Window> windows_;
};

} // namespace server
} // namespace mcphub
