#include "mcp-hub/server/CommandHandlers.hpp"
#include "mcp-hub/Logger.hpp"
#include "mcp-hub/version.hpp"

#include <fmt/format.h>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace mcphub {
namespace server {

namespace {

// One year; keeps the millisecond TTL far from int64 overflow
constexpr double kMaxTtlMinutes = 525600.0;

std::string string_param(const json &params, const char *name) {
  if (!params.is_object()) {
    return "";
  }
  auto it = params.find(name);
  if (it == params.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

// Fills `out` and returns 400 when either identifier is missing, 0 otherwise
int require_identity(const json &params, std::string &client_id,
                     std::string &server_name, json &out) {
  client_id = string_param(params, "clientId");
  server_name = string_param(params, "MCPServerName");
  if (client_id.empty()) {
    out = {{"error", "clientId is required"}};
    return 400;
  }
  if (server_name.empty()) {
    out = {{"error", "MCPServerName is required"}};
    return 400;
  }
  return 0;
}

// Look up an initialized, live process. Returns 0 and sets `process`, or the
// HTTP status with `out` describing why the process cannot be used.
int resolve_process(HandlerContext &ctx, const std::string &client_id,
                    const std::string &server_name,
                    std::shared_ptr<ipc::ChildProcess> &process, json &out) {
  const HealthStatus health = ctx.registry.is_healthy(client_id, server_name);
  const json identity = {{"clientId", client_id},
                         {"MCPServerName", server_name}};

  if (health.reason == HealthReason::NotFound) {
    out = identity;
    out["error"] = "MCP Server '" + server_name + "' not found for client '" +
                   client_id + "'. Start first with /start";
    return 404;
  }
  if (health.reason == HealthReason::NotInitialized) {
    out = identity;
    out["error"] = "MCP Server '" + server_name +
                   "' not yet initialized. Wait a few seconds after /start";
    out["suggestion"] = "Try again in a few seconds or check logs";
    return 400;
  }
  if (health.healthy) {
    process = ctx.registry.get_process(client_id, server_name);
  }
  if (!process) {
    out = identity;
    out["error"] = "MCP Server '" + server_name +
                   "' was terminated. Execute /start again";
    out["suggestion"] = "The process was terminated. Start again with /start";
    return 410;
  }
  return 0;
}

json summaries_to_json(const std::vector<ProcessSummary> &summaries) {
  json list = json::array();
  for (const auto &summary : summaries) {
    list.push_back(summary.to_json());
  }
  return list;
}

std::string now_iso() {
  return format_timestamp(std::chrono::system_clock::now());
}

} // namespace

int handle_service_health(HandlerContext &ctx, const json &, json &out) {
  auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - ctx.started_at);
  out = {{"ok", true},
         {"service", SERVICE_NAME},
         {"version", VERSION},
         {"timestamp", now_iso()},
         {"uptime", static_cast<double>(uptime.count()) / 1000.0}};
  return 200;
}

int handle_service_info(HandlerContext &ctx, const json &, json &out) {
  const auto &cfg = ctx.config;
  out = {
      {"service", SERVICE_NAME},
      {"description",
       "Supervisor for MCP server processes shared across client sessions"},
      {"version", VERSION},
      {"endpoints",
       {{"GET /health", "Health check (public)"},
        {"POST /api/start", "Start or reuse an MCP server (protected)"},
        {"GET /api/list?clientId=xxx",
         "List all MCP servers for a client (protected)"},
        {"GET /api/details?clientId=xxx&MCPServerName=yyy",
         "List the tools of a specific MCP server (protected)"},
        {"POST /api/run", "Execute a tool on a specific MCP server (protected)"},
        {"GET /api/health?clientId=xxx&MCPServerName=yyy",
         "Check health of a specific MCP server (protected)"},
        {"GET /api/status", "List all active processes (protected)"},
        {"DELETE /api/kill?clientId=xxx&MCPServerName=yyy",
         "Terminate a specific process (protected)"}}},
      {"authentication",
       {{"headers",
         {"Authorization: Bearer <your-token>", "X-Auth-Token: <your-token>"}},
        {"query", "?token=<your-token>"}}},
      {"rateLimits",
       {{"standard", std::to_string(cfg.rate_limit.max_requests) +
                         " requests per " +
                         std::to_string(cfg.rate_limit.window.count()) +
                         " ms"},
        {"strict", std::to_string(cfg.strict_rate_limit.max_requests) +
                       " requests per " +
                       std::to_string(cfg.strict_rate_limit.window.count()) +
                       " ms for /api/run"}}},
      {"configuration",
       {{"maxRequestSize", cfg.max_request_size},
        {"corsEnabled", cfg.cors_enabled},
        {"defaultTTLMinutes", cfg.default_ttl.count()}}}};
  return 200;
}

int handle_start(HandlerContext &ctx, const json &params, json &out) {
  std::string client_id;
  std::string server_name;
  if (int rc = require_identity(params, client_id, server_name, out)) {
    return rc;
  }

  LaunchConfig config;
  try {
    config = LaunchConfig::from_json(params.value("config", json()));
  } catch (const std::invalid_argument &) {
    out = {{"error", "config must contain {command: string, args: string[]}"}};
    return 400;
  }

  auto ttl_minutes = static_cast<double>(ctx.config.default_ttl.count());
  if (params.contains("ttlMinutes") && !params["ttlMinutes"].is_null()) {
    if (!params["ttlMinutes"].is_number() ||
        params["ttlMinutes"].get<double>() <= 0) {
      out = {{"error", "ttlMinutes must be a positive number"}};
      return 400;
    }
    if (params["ttlMinutes"].get<double>() > kMaxTtlMinutes) {
      out = {{"error", fmt::format("ttlMinutes must not exceed {}",
                                   static_cast<int64_t>(kMaxTtlMinutes))}};
      return 400;
    }
    ttl_minutes = params["ttlMinutes"].get<double>();
  }
  auto ttl = std::chrono::milliseconds(
      static_cast<int64_t>(ttl_minutes * 60000.0));

  EnsureResult result;
  try {
    result = ctx.registry.ensure_process(client_id, server_name, config, ttl);
  } catch (const SpawnError &e) {
    LOG_ERROR("API", make_key(client_id, server_name),
              "Error starting MCP server: {}", e.what());
    out = {{"error", "Internal error starting MCP server"},
           {"details", e.what()}};
    return 500;
  }

  std::string message;
  if (result.was_already_running && result.initialized) {
    message = "MCP Server '" + server_name +
              "' is already running and operational for receiving calls";
  } else if (result.initialized) {
    message = "MCP Server '" + server_name +
              "' started and initialized successfully";
  } else {
    message = "MCP Server '" + server_name +
              "' is running but MCP initialization did not complete. "
              "Call /start again to retry";
  }

  out = {{"ok", true},
         {"clientId", client_id},
         {"MCPServerName", server_name},
         {"uniqueKey", result.key},
         {"status", result.was_already_running ? "already-running" : "started"},
         {"pid", result.process->pid()},
         {"initialized", result.initialized},
         {"message", message},
         {"configuration",
          {{"ttlMinutes", ttl_minutes},
           {"defaultTTL", ctx.config.default_ttl.count()}}}};
  LOG_INFO("API", result.key, "start -> {}", out["status"].get<std::string>());
  return 200;
}

int handle_list(HandlerContext &ctx, const json &params, json &out) {
  const std::string client_id = string_param(params, "clientId");
  if (client_id.empty()) {
    out = {{"error", "clientId is required"}};
    return 400;
  }
  auto servers = ctx.registry.list_for_client(client_id);
  out = {{"ok", true},
         {"clientId", client_id},
         {"totalServers", servers.size()},
         {"servers", summaries_to_json(servers)}};
  return 200;
}

int handle_details(HandlerContext &ctx, const json &params, json &out) {
  std::string client_id;
  std::string server_name;
  if (int rc = require_identity(params, client_id, server_name, out)) {
    return rc;
  }
  std::shared_ptr<ipc::ChildProcess> process;
  if (int rc = resolve_process(ctx, client_id, server_name, process, out)) {
    return rc;
  }

  CallResult result =
      ctx.registry.fetch_details(process, ctx.config.response_timeout);
  if (!result.ok()) {
    out = {{"error", "Error querying MCP Server '" + server_name + "'"},
           {"clientId", client_id},
           {"MCPServerName", server_name},
           {"details", result.error_message},
           {"suggestion", "Execute /start again"}};
    return 500;
  }

  out = {{"ok", true},
         {"clientId", client_id},
         {"MCPServerName", server_name},
         {"uniqueKey", make_key(client_id, server_name)},
         {"details", result.to_json()}};
  return 200;
}

int handle_run(HandlerContext &ctx, const json &params, json &out) {
  std::string client_id;
  std::string server_name;
  if (int rc = require_identity(params, client_id, server_name, out)) {
    return rc;
  }
  std::shared_ptr<ipc::ChildProcess> process;
  if (int rc = resolve_process(ctx, client_id, server_name, process, out)) {
    return rc;
  }

  const std::string tool = string_param(params, "tool");
  const std::string input = string_param(params, "input");
  if (tool.empty() && input.empty()) {
    out = {{"error", "Must provide \"tool\" or \"input\""}};
    return 400;
  }

  const std::string key = make_key(client_id, server_name);
  CallResult result;
  if (!input.empty()) {
    result = ctx.registry.call_raw(process, input, ctx.config.run_timeout);
  } else {
    json arguments = params.value("arguments", json::object());
    result = ctx.registry.call_tool(process, tool, arguments,
                                    ctx.config.run_timeout);
  }

  if (result.outcome == CallResult::Outcome::CommunicationError) {
    out = {{"error", "Error communicating with MCP Server '" + server_name +
                         "'. Process may have been terminated"},
           {"clientId", client_id},
           {"MCPServerName", server_name},
           {"details", result.error_message},
           {"suggestion", "Execute /start again"}};
    return 500;
  }
  if (result.outcome == CallResult::Outcome::ProcessDied) {
    out = {{"error",
            "MCP Server '" + server_name + "' terminated during execution"},
           {"clientId", client_id},
           {"MCPServerName", server_name},
           {"processExitCode", nullptr},
           {"processSignal", nullptr},
           {"suggestion", "Execute /start again"}};
    if (result.exit_status && result.exit_status->code) {
      out["processExitCode"] = *result.exit_status->code;
    }
    if (result.exit_status && result.exit_status->signal) {
      out["processSignal"] = *result.exit_status->signal;
    }
    return 500;
  }

  LOG_INFO("API", key, "Executed '{}'", tool.empty() ? "custom-input" : tool);
  out = {{"ok", true},
         {"clientId", client_id},
         {"MCPServerName", server_name},
         {"uniqueKey", key},
         {"tool", tool.empty() ? "custom-input" : tool},
         {"result", result.to_json()}};
  return 200;
}

int handle_process_health(HandlerContext &ctx, const json &params, json &out) {
  std::string client_id;
  std::string server_name;
  if (int rc = require_identity(params, client_id, server_name, out)) {
    return rc;
  }
  const HealthStatus health = ctx.registry.is_healthy(client_id, server_name);
  out = {{"ok", health.healthy},
         {"clientId", client_id},
         {"MCPServerName", server_name},
         {"uniqueKey", make_key(client_id, server_name)}};
  if (health.healthy) {
    out["status"] = "healthy";
    out["message"] = "MCP server is operational";
    return 200;
  }
  out["status"] = "unhealthy";
  out["reason"] = to_string(health.reason);
  out["suggestion"] = health.reason == HealthReason::NotFound
                          ? "Execute /start first"
                          : "Execute /start again";
  return 503;
}

int handle_status(HandlerContext &ctx, const json &, json &out) {
  auto processes = ctx.registry.list_all();
  out = {{"ok", true},
         {"activeProcesses", processes.size()},
         {"processes", summaries_to_json(processes)}};
  return 200;
}

int handle_kill(HandlerContext &ctx, const json &params, json &out) {
  std::string client_id;
  std::string server_name;
  if (int rc = require_identity(params, client_id, server_name, out)) {
    return rc;
  }
  if (ctx.registry.kill_process(client_id, server_name)) {
    out = {{"ok", true},
           {"message", "Process " + make_key(client_id, server_name) +
                           " terminated"},
           {"clientId", client_id},
           {"MCPServerName", server_name}};
    return 200;
  }
  out = {{"error", "Process not found"},
         {"clientId", client_id},
         {"MCPServerName", server_name}};
  return 404;
}

} // namespace server
} // namespace mcphub
