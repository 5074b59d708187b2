#pragma once
#include "mcp-hub/ipc/ChildProcess.hpp"
#include "mcp-hub/ipc/JsonRpc.hpp"
#include "mcp-hub/types.hpp"

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mcphub {
namespace server {

/// Ad hoc request/response exchanges with a running child. Output is
/// collected for a fixed window; the first JSON line becomes the response.
class RequestCorrelator {
public:
  explicit RequestCorrelator(ipc::RequestIdGenerator &ids) : ids_(ids) {}

  /// Write `line` and collect stdout/stderr for up to `timeout`. When
  /// `match_id` is set, returns as soon as a response with that id arrives.
  CallResult call(const std::shared_ptr<ipc::ChildProcess> &process,
                  const std::string &line, std::chrono::milliseconds timeout,
                  std::optional<int64_t> match_id = std::nullopt);

  /// `tools/call` for `tool` with `arguments` (null becomes {})
  CallResult call_tool(const std::shared_ptr<ipc::ChildProcess> &process,
                       const std::string &tool,
                       const nlohmann::json &arguments,
                       std::chrono::milliseconds timeout);

  /// Send a caller-built request verbatim (newline appended if missing)
  CallResult call_raw(const std::shared_ptr<ipc::ChildProcess> &process,
                      const std::string &raw_input,
                      std::chrono::milliseconds timeout);

  /// `tools/list`, matched by id
  CallResult fetch_details(const std::shared_ptr<ipc::ChildProcess> &process,
                           std::chrono::milliseconds timeout);

private:
  ipc::RequestIdGenerator &ids_;
};

} // namespace server
} // namespace mcphub
