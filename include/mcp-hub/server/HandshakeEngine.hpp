#pragma once
#include "mcp-hub/ipc/ChildProcess.hpp"
#include "mcp-hub/ipc/JsonRpc.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace mcphub {
namespace server {

/// Drives the MCP initialize exchange and liveness pings for a child
class HandshakeEngine {
public:
  HandshakeEngine(ipc::RequestIdGenerator &ids, std::string client_name,
                  std::string client_version,
                  std::chrono::milliseconds timeout = std::chrono::seconds(30));

  /// Send `initialize`, wait for the matching result, then send
  /// `notifications/initialized`. Returns false on timeout, on write failure
  /// or when the child exits first. Stderr chatter is never fatal.
  bool initialize(const std::shared_ptr<ipc::ChildProcess> &process);

  /// Fire-and-forget `ping`. Only a failed write counts as failure.
  bool ping(const std::shared_ptr<ipc::ChildProcess> &process);

  /// Stderr lines that servers commonly print on startup
  static bool is_benign_stderr(const std::string &line);

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  ipc::RequestIdGenerator &ids_;
  std::string client_name_;
  std::string client_version_;
  std::chrono::milliseconds timeout_;
};

} // namespace server
} // namespace mcphub
