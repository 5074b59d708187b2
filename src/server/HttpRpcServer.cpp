#include "mcp-hub/server/HttpRpcServer.hpp"
#include "mcp-hub/Logger.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <optional>
#include <sstream>
#include <string>

using json = nlohmann::json;

namespace mcphub {
namespace server {

namespace {
constexpr int BACKLOG = 64;
constexpr size_t MAX_HEADER_READ = 64 * 1024; // 64 KB
constexpr int CLIENT_RECV_TIMEOUT_SEC = 30;
constexpr auto DRAIN_TIMEOUT = std::chrono::seconds(15);

// Read exactly n bytes into buffer. Returns true if successful.
bool read_n(int fd, char *buf, size_t n) {
  size_t read_total = 0;
  while (read_total < n) {
    ssize_t r = recv(fd, buf + read_total, n - read_total, 0);
    if (r <= 0)
      return false;
    read_total += static_cast<size_t>(r);
  }
  return true;
}

// Read until "\r\n\r\n" or until limit. Any bytes read past the headers are
// returned in extra_data.
bool read_http_headers(int fd, std::string &out_headers,
                       std::string &extra_data) {
  out_headers.clear();
  extra_data.clear();
  char buf[1024];
  while (out_headers.size() < MAX_HEADER_READ) {
    ssize_t r = recv(fd, buf, sizeof(buf), 0);
    if (r <= 0)
      return false;
    out_headers.append(buf, buf + r);
    auto pos = out_headers.find("\r\n\r\n");
    if (pos != std::string::npos) {
      size_t headers_end = pos + 4;
      if (headers_end < out_headers.size()) {
        extra_data = out_headers.substr(headers_end);
        out_headers.resize(headers_end);
      }
      return true;
    }
  }
  return false;
}

// Request line and header fields. Header names are lower-cased.
bool parse_head(const std::string &head, HttpRequest &request,
                std::string &target) {
  std::istringstream hs(head);
  std::string line;
  if (!std::getline(hs, line))
    return false;
  if (!line.empty() && line.back() == '\r')
    line.pop_back();

  std::string proto;
  {
    std::istringstream rl(line);
    rl >> request.method >> target >> proto;
  }
  if (request.method.empty() || target.empty())
    return false;

  while (std::getline(hs, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      break;
    auto colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    size_t i = colon + 1;
    while (i < line.size() && isspace(static_cast<unsigned char>(line[i])))
      ++i;
    request.headers[name] = line.substr(i);
  }
  return true;
}

// Content-Length, or -1 when absent or malformed
long long content_length(const HttpRequest &request) {
  auto value = request.header("content-length");
  if (!value)
    return -1;
  try {
    size_t consumed = 0;
    long long n = std::stoll(*value, &consumed);
    return consumed == value->size() && n >= 0 ? n : -1;
  } catch (const std::logic_error &) {
    return -1;
  }
}

void send_http_response(int fd, const HttpResponse &response) {
  const std::string body = response.serialize_body();
  std::ostringstream resp;
  resp << "HTTP/1.0 " << response.status << " "
       << status_text(response.status) << "\r\n";
  resp << "Content-Type: application/json\r\n";
  resp << "Content-Length: " << body.size() << "\r\n";
  for (const auto &[name, value] : response.headers) {
    resp << name << ": " << value << "\r\n";
  }
  resp << "Connection: close\r\n";
  resp << "\r\n";
  resp << body;
  std::string s = resp.str();
  size_t sent = 0;
  while (sent < s.size()) {
    ssize_t w = send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
    if (w <= 0)
      break;
    sent += static_cast<size_t>(w);
  }
}

HttpResponse error_response(int status, const std::string &error) {
  HttpResponse response;
  response.status = status;
  response.body = {{"error", error}};
  return response;
}

json query_to_params(const HttpRequest &request) {
  json params = json::object();
  for (const auto &[name, value] : request.query) {
    params[name] = value;
  }
  return params;
}

} // namespace

HttpRpcServer::HttpRpcServer(ProcessRegistry &registry,
                             const HubConfig &config)
    : config_(config),
      context_{registry, config, std::chrono::steady_clock::now()},
      auth_(config.auth_token),
      standard_limiter_(config.rate_limit.max_requests,
                        config.rate_limit.window),
      strict_limiter_(config.strict_rate_limit.max_requests,
                      config.strict_rate_limit.window),
      running_(false), listen_fd_(-1), bound_port_(0) {}

HttpRpcServer::~HttpRpcServer() { stop(); }

bool HttpRpcServer::start(uint16_t port) {
  if (running_) {
    return true;
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    LOG_ERROR("HTTP", "SOCKET", "Failed to create socket: {}",
              strerror(errno));
    return false;
  }

  // Allow immediate reuse
  int opt = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
    LOG_ERROR("HTTP", "BIND", "Invalid bind address: {}",
              config_.bind_address);
    close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  if (bind(listen_fd_, reinterpret_cast<struct sockaddr *>(&addr),
           sizeof(addr)) < 0) {
    LOG_ERROR("HTTP", "BIND", "bind {}:{} failed: {}", config_.bind_address,
              port, strerror(errno));
    close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  if (listen(listen_fd_, BACKLOG) < 0) {
    LOG_ERROR("HTTP", "LISTEN", "listen failed: {}", strerror(errno));
    close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  // If port was 0, query assigned port
  struct sockaddr_in sin;
  socklen_t len = sizeof(sin);
  if (getsockname(listen_fd_, reinterpret_cast<struct sockaddr *>(&sin),
                  &len) == 0) {
    bound_port_ = ntohs(sin.sin_port);
  } else {
    bound_port_ = port;
  }

  running_ = true;
  server_thread_ = std::thread(&HttpRpcServer::run_loop, this);
  LOG_INFO("HTTP", "START", "Listening on {}:{}", config_.bind_address,
           bound_port_);
  return true;
}

void HttpRpcServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // Unblock accept()
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  std::unique_lock lock(connections_mutex_);
  if (!connections_cv_.wait_for(lock, DRAIN_TIMEOUT,
                                [this] { return active_connections_ == 0; })) {
    LOG_WARN("HTTP", "STOP", "Waiting for {} request(s) still in flight",
             active_connections_);
    connections_cv_.wait(lock, [this] { return active_connections_ == 0; });
  }
  LOG_INFO("HTTP", "STOP", "HTTP server stopped");
}

void HttpRpcServer::run_loop() {
  const int listen_fd = listen_fd_;
  while (running_) {
    struct sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_socket =
        accept(listen_fd, reinterpret_cast<struct sockaddr *>(&client_addr),
               &client_len);
    if (client_socket < 0) {
      if (!running_)
        break;
      LOG_WARN("HTTP", "ACCEPT", "accept failed: {}", strerror(errno));
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }

    char address[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &client_addr.sin_addr, address, sizeof(address));

    struct timeval tv;
    tv.tv_sec = CLIENT_RECV_TIMEOUT_SEC;
    tv.tv_usec = 0;
    setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    {
      std::lock_guard lock(connections_mutex_);
      ++active_connections_;
    }
    // Requests may block for seconds (handshake, run window), so each gets
    // its own thread
    std::thread(&HttpRpcServer::handle_connection, this, client_socket,
                std::string(address))
        .detach();
  }
}

void HttpRpcServer::handle_connection(int client_socket,
                                      std::string remote_address) {
  HttpRequest request;
  request.remote_address = std::move(remote_address);
  HttpResponse response;
  bool respond = true;

  std::string head;
  std::string extra;
  std::string target;
  if (!read_http_headers(client_socket, head, extra) ||
      !parse_head(head, request, target)) {
    LOG_WARN("HTTP", request.remote_address, "Malformed request headers");
    response = error_response(400, "Malformed request");
  } else {
    parse_target(target, request);
    LOG_DEBUG("HTTP", request.remote_address, "{} {}", request.method,
              request.path);

    long long length = content_length(request);
    if (length > 0 &&
        static_cast<unsigned long long>(length) > config_.max_request_size) {
      response = error_response(413, "Request body too large");
      response.body["limit"] = config_.max_request_size;
    } else {
      if (length > 0) {
        request.body = extra;
        if (request.body.size() < static_cast<size_t>(length)) {
          size_t old_size = request.body.size();
          request.body.resize(static_cast<size_t>(length));
          if (!read_n(client_socket, &request.body[old_size],
                      static_cast<size_t>(length) - old_size)) {
            LOG_WARN("HTTP", request.remote_address,
                     "Failed to read request body");
            respond = false;
          }
        } else {
          request.body.resize(static_cast<size_t>(length));
        }
      }
      if (respond) {
        response = dispatch(request);
      }
    }
  }

  if (respond) {
    apply_headers(request, response);
    send_http_response(client_socket, response);
  }
  close(client_socket);

  std::lock_guard lock(connections_mutex_);
  --active_connections_;
  connections_cv_.notify_all();
}

HttpResponse HttpRpcServer::dispatch(const HttpRequest &request) {
  HttpResponse response;
  try {
    response = route(request);
  } catch (const std::exception &e) {
    LOG_ERROR("HTTP", request.path, "Handler failed: {}", e.what());
    response = error_response(500, "Internal error");
    response.body["details"] = e.what();
  }
  apply_headers(request, response);
  return response;
}

HttpResponse HttpRpcServer::route(const HttpRequest &request) {
  HttpResponse response;
  const std::string &method = request.method;
  const std::string &path = request.path;

  if (method == "OPTIONS") {
    response.status = 200;
    return response;
  }

  if (path == "/health" && method == "GET") {
    response.status = handle_service_health(context_, json::object(),
                                            response.body);
    return response;
  }
  if (path == "/" && method == "GET") {
    response.status =
        handle_service_info(context_, json::object(), response.body);
    return response;
  }

  if (path.rfind("/api/", 0) != 0) {
    response = error_response(404, "Endpoint not found");
    response.body["path"] = path;
    response.body["method"] = method;
    return response;
  }

  auto limited = [&request](RateLimiter &limiter) {
    RateDecision decision = limiter.check(request.remote_address);
    if (decision.allowed) {
      return std::optional<HttpResponse>();
    }
    LOG_WARN("HTTP", request.remote_address,
             "Rate limit exceeded on {} {}", request.method, request.path);
    HttpResponse r = error_response(429, "Too many requests");
    r.body["message"] = "Rate limit exceeded. Please try again later.";
    r.body["limit"] = limiter.max_requests();
    r.body["windowMs"] = limiter.window().count();
    r.body["retryAfter"] = decision.retry_after.count();
    r.body["timestamp"] =
        format_timestamp(std::chrono::system_clock::now());
    r.headers.emplace_back("Retry-After",
                           std::to_string(decision.retry_after.count()));
    return std::optional<HttpResponse>(r);
  };

  if (auto rejected = limited(standard_limiter_)) {
    return *rejected;
  }

  switch (auth_.check(request)) {
  case AuthResult::Ok:
    break;
  case AuthResult::Missing:
    LOG_WARN("AUTH", request.remote_address, "No token provided for {} {}",
             method, path);
    response = error_response(401, "Authentication required");
    response.body["message"] = "Provide a valid authentication token";
    response.body["methods"] = {{"header1", "Authorization: Bearer <your-token>"},
                                {"header2", "X-Auth-Token: <your-token>"},
                                {"query", "?token=<your-token>"}};
    return response;
  case AuthResult::Invalid:
    LOG_WARN("AUTH", request.remote_address, "Invalid token for {} {}",
             method, path);
    return error_response(401, "Invalid authentication token");
  }

  json params;
  if (method == "POST") {
    if (request.body.empty()) {
      params = json::object();
    } else {
      params = json::parse(request.body, nullptr, false);
      if (params.is_discarded() || !params.is_object()) {
        return error_response(400, "Request body must be a JSON object");
      }
    }
  } else {
    params = query_to_params(request);
  }

  if (method == "POST" && path == "/api/start") {
    response.status = handle_start(context_, params, response.body);
  } else if (method == "GET" && path == "/api/list") {
    response.status = handle_list(context_, params, response.body);
  } else if (method == "GET" && path == "/api/details") {
    response.status = handle_details(context_, params, response.body);
  } else if (method == "POST" && path == "/api/run") {
    if (auto rejected = limited(strict_limiter_)) {
      return *rejected;
    }
    response.status = handle_run(context_, params, response.body);
  } else if (method == "GET" && path == "/api/health") {
    response.status = handle_process_health(context_, params, response.body);
  } else if (method == "GET" && path == "/api/status") {
    response.status = handle_status(context_, params, response.body);
  } else if (method == "DELETE" && path == "/api/kill") {
    response.status = handle_kill(context_, params, response.body);
  } else {
    response = error_response(404, "Endpoint not found");
    response.body["path"] = path;
    response.body["method"] = method;
  }
  return response;
}

void HttpRpcServer::apply_headers(const HttpRequest &request,
                                  HttpResponse &response) const {
  auto has_header = [&response](const std::string &name) {
    return std::any_of(response.headers.begin(), response.headers.end(),
                       [&name](const auto &h) { return h.first == name; });
  };
  auto set = [&](const std::string &name, const std::string &value) {
    if (!has_header(name)) {
      response.headers.emplace_back(name, value);
    }
  };

  if (config_.cors_enabled) {
    const auto &origins = config_.allowed_origins;
    if (std::find(origins.begin(), origins.end(), "*") != origins.end()) {
      set("Access-Control-Allow-Origin", "*");
    } else if (auto origin = request.header("origin");
               origin &&
               std::find(origins.begin(), origins.end(), *origin) !=
                   origins.end()) {
      set("Access-Control-Allow-Origin", *origin);
      set("Vary", "Origin");
    }
    set("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
    set("Access-Control-Allow-Headers",
        "Origin, X-Requested-With, Content-Type, Accept, Authorization, "
        "X-Auth-Token");
    set("Access-Control-Allow-Credentials", "true");
  }

  set("X-Content-Type-Options", "nosniff");
  set("X-Frame-Options", "DENY");
  set("X-XSS-Protection", "1; mode=block");
  set("Referrer-Policy", "strict-origin-when-cross-origin");
}

} // namespace server
} // namespace mcphub
