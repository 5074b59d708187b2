#pragma once
#include "mcp-hub/Config.hpp"
#include "mcp-hub/server/AuthGuard.hpp"
#include "mcp-hub/server/CommandHandlers.hpp"
#include "mcp-hub/server/HttpMessage.hpp"
#include "mcp-hub/server/ProcessRegistry.hpp"
#include "mcp-hub/server/RateLimiter.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace mcphub {
namespace server {

class HttpRpcServer {
public:
  HttpRpcServer(ProcessRegistry &registry, const HubConfig &config);
  ~HttpRpcServer();

  HttpRpcServer(const HttpRpcServer &) = delete;
  HttpRpcServer &operator=(const HttpRpcServer &) = delete;

  // Bind to config.bind_address:port (0 picks an ephemeral port) and start
  // accepting. Returns false if the socket cannot be bound.
  bool start(uint16_t port);

  // Stop accepting, wait for in-flight requests and join the accept thread.
  void stop();

  uint16_t port() const { return bound_port_; }
  bool is_running() const { return running_; }

  // Route one parsed request: auth, rate limits, handler, headers
  HttpResponse dispatch(const HttpRequest &request);

private:
  void run_loop();
  void handle_connection(int client_socket, std::string remote_address);
  HttpResponse route(const HttpRequest &request);
  void apply_headers(const HttpRequest &request, HttpResponse &response) const;

  const HubConfig &config_;
  HandlerContext context_;
  AuthGuard auth_;
  RateLimiter standard_limiter_;
  RateLimiter strict_limiter_;

  std::atomic<bool> running_;
  std::thread server_thread_;
  int listen_fd_;
  uint16_t bound_port_;

  std::mutex connections_mutex_;
  std::condition_variable connections_cv_;
  int active_connections_{0};
};

} // namespace server
} // namespace mcphub
