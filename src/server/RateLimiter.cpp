#include "mcp-hub/server/RateLimiter.hpp"

#include <algorithm>

namespace mcphub {
namespace server {

RateLimiter::RateLimiter(int max_requests, std::chrono::milliseconds window,
                         Clock clock)
    : max_requests_(max_requests), window_(window), clock_(std::move(clock)) {}

RateDecision RateLimiter::check(const std::string &client) {
  const auto now = clock_();
  std::lock_guard lock(mutex_);
  auto &w = windows_[client];
  if (w.count == 0 || now - w.started >= window_) {
    w.started = now;
    w.count = 0;
  }
  ++w.count;

  RateDecision decision;
  decision.allowed = w.count <= max_requests_;
  decision.remaining = std::max(0, max_requests_ - w.count);
  if (!decision.allowed) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        w.started + window_ - now);
    // Round up so clients never retry early
    decision.retry_after = std::chrono::seconds((left.count() + 999) / 1000);
  }
  return decision;
}

void RateLimiter::prune() {
  const auto now = clock_();
  std::lock_guard lock(mutex_);
  for (auto it = windows_.begin(); it != windows_.end();) {
    if (now - it->second.started >= window_) {
      it = windows_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace server
} // namespace mcphub
