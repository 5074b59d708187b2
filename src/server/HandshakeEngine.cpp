#include "mcp-hub/server/HandshakeEngine.hpp"
#include "mcp-hub/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <mutex>

namespace mcphub {
namespace server {

namespace {

constexpr const char *BENIGN_STDERR_PATTERNS[] = {
    "running on stdio", "server running", "server started", "listening on",
    "connected",        "[info]",         "info:",          "debug"};

constexpr auto WRITE_TIMEOUT = std::chrono::seconds(1);

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace

HandshakeEngine::HandshakeEngine(ipc::RequestIdGenerator &ids,
                                 std::string client_name,
                                 std::string client_version,
                                 std::chrono::milliseconds timeout)
    : ids_(ids), client_name_(std::move(client_name)),
      client_version_(std::move(client_version)), timeout_(timeout) {}

bool HandshakeEngine::is_benign_stderr(const std::string &line) {
  const std::string lowered = to_lower(line);
  for (const char *pattern : BENIGN_STDERR_PATTERNS) {
    if (lowered.find(pattern) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool HandshakeEngine::initialize(
    const std::shared_ptr<ipc::ChildProcess> &process) {
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    ipc::LineBuffer stdout_lines;
    ipc::LineBuffer stderr_lines;
    bool matched = false;
    bool exited = false;
  };

  auto state = std::make_shared<State>();
  const int64_t id = ids_.next();
  const std::string label = process->label();

  auto output_hook = process->scoped_output_listener(
      [state, id, label](ipc::StreamKind stream, const std::string &chunk) {
        std::lock_guard lock(state->mutex);
        if (stream == ipc::StreamKind::Stderr) {
          for (const auto &raw : state->stderr_lines.append(chunk)) {
            std::string line = ipc::trim(raw);
            if (line.empty()) {
              continue;
            }
            if (is_benign_stderr(line)) {
              LOG_DEBUG("HANDSHAKE", label, "stderr: {}", line);
            } else {
              LOG_ERROR("HANDSHAKE", label, "stderr: {}", line);
            }
          }
          return;
        }
        for (const auto &line : state->stdout_lines.append(chunk)) {
          if (state->matched) {
            break;
          }
          auto message = ipc::parse_json_line(line);
          if (message && ipc::matches_id(*message, id) &&
              message->contains("result")) {
            state->matched = true;
            state->cv.notify_all();
          }
        }
      });

  auto exit_hook = process->scoped_exit_listener([state](const ExitStatus &) {
    std::lock_guard lock(state->mutex);
    state->exited = true;
    state->cv.notify_all();
  });

  LOG_DEBUG("HANDSHAKE", label, "Sending initialize (id={})", id);
  if (!process->write(
          ipc::build_initialize_request(id, client_name_, client_version_),
          WRITE_TIMEOUT)) {
    LOG_ERROR("HANDSHAKE", label, "Failed to write initialize request");
    return false;
  }

  bool matched = false;
  bool exited = false;
  {
    std::unique_lock lock(state->mutex);
    state->cv.wait_for(lock, timeout_,
                       [&] { return state->matched || state->exited; });
    matched = state->matched;
    exited = state->exited;
  }

  if (!matched) {
    if (exited) {
      LOG_ERROR("HANDSHAKE", label, "Process exited during initialization");
    } else {
      LOG_WARN("HANDSHAKE", label, "Initialization timed out after {} ms",
               timeout_.count());
    }
    return false;
  }

  if (!process->write(ipc::build_initialized_notification(), WRITE_TIMEOUT)) {
    LOG_ERROR("HANDSHAKE", label,
              "Failed to write initialized notification");
    return false;
  }

  LOG_INFO("HANDSHAKE", label, "Initialized (pid {})", process->pid());
  return true;
}

bool HandshakeEngine::ping(const std::shared_ptr<ipc::ChildProcess> &process) {
  if (!process->is_alive()) {
    return false;
  }
  const int64_t id = ids_.next();
  if (!process->write(ipc::build_ping(id), std::chrono::milliseconds(0))) {
    LOG_WARN("HEARTBEAT", process->label(), "Ping write failed (id={})", id);
    return false;
  }
  LOG_TRACE("HEARTBEAT", process->label(), "Ping sent (id={})", id);
  return true;
}

} // namespace server
} // namespace mcphub
