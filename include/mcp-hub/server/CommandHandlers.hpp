#pragma once
#include "mcp-hub/Config.hpp"
#include "mcp-hub/server/ProcessRegistry.hpp"

#include <chrono>
#include <nlohmann/json.hpp>

namespace mcphub {
namespace server {

/// Everything a handler may touch. Owned by the caller (HttpRpcServer).
struct HandlerContext {
  ProcessRegistry &registry;
  const HubConfig &config;
  std::chrono::steady_clock::time_point started_at;
};

/// Route handlers for the HTTP front end.
///
/// Each handler accepts a JSON `params` object (query parameters for GET and
/// DELETE, the request body for POST) and fills `out` with the JSON response.
/// The return value is the HTTP status code.
int handle_service_health(HandlerContext &ctx, const nlohmann::json &params,
                          nlohmann::json &out);
int handle_service_info(HandlerContext &ctx, const nlohmann::json &params,
                        nlohmann::json &out);
int handle_start(HandlerContext &ctx, const nlohmann::json &params,
                 nlohmann::json &out);
int handle_list(HandlerContext &ctx, const nlohmann::json &params,
                nlohmann::json &out);
int handle_details(HandlerContext &ctx, const nlohmann::json &params,
                   nlohmann::json &out);
int handle_run(HandlerContext &ctx, const nlohmann::json &params,
               nlohmann::json &out);
int handle_process_health(HandlerContext &ctx, const nlohmann::json &params,
                          nlohmann::json &out);
int handle_status(HandlerContext &ctx, const nlohmann::json &params,
                  nlohmann::json &out);
int handle_kill(HandlerContext &ctx, const nlohmann::json &params,
                nlohmann::json &out);

} // namespace server
} // namespace mcphub
