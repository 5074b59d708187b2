#include "mcp-hub/server/RequestCorrelator.hpp"
#include "mcp-hub/Logger.hpp"

#include <condition_variable>
#include <mutex>

namespace mcphub {
namespace server {

namespace {

constexpr auto WRITE_TIMEOUT = std::chrono::seconds(1);

} // namespace

CallResult
RequestCorrelator::call(const std::shared_ptr<ipc::ChildProcess> &process,
                        const std::string &line,
                        std::chrono::milliseconds timeout,
                        std::optional<int64_t> match_id) {
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    std::string out;
    std::string err;
    ipc::LineBuffer lines;
    bool matched = false;
    std::optional<ExitStatus> died;
  };

  auto state = std::make_shared<State>();
  const std::string label = process->label();

  auto output_hook = process->scoped_output_listener(
      [state, match_id](ipc::StreamKind stream, const std::string &chunk) {
        std::lock_guard lock(state->mutex);
        if (stream == ipc::StreamKind::Stderr) {
          state->err += chunk;
          return;
        }
        state->out += chunk;
        if (!match_id || state->matched) {
          return;
        }
        for (const auto &l : state->lines.append(chunk)) {
          auto message = ipc::parse_json_line(l);
          if (message && ipc::matches_id(*message, *match_id)) {
            state->matched = true;
            state->cv.notify_all();
            break;
          }
        }
      });

  auto exit_hook =
      process->scoped_exit_listener([state](const ExitStatus &status) {
        std::lock_guard lock(state->mutex);
        state->died = status;
        state->cv.notify_all();
      });

  CallResult result;
  if (!process->write(line, WRITE_TIMEOUT)) {
    LOG_ERROR("CALL", label, "Failed to write request");
    result.outcome = CallResult::Outcome::CommunicationError;
    result.error_message = "failed to write to process stdin";
    return result;
  }

  std::unique_lock lock(state->mutex);
  state->cv.wait_for(lock, timeout,
                     [&] { return state->matched || state->died; });

  result.raw_output = ipc::trim(state->out);
  result.error_output = ipc::trim(state->err);

  if (state->died && !state->matched) {
    result.outcome = CallResult::Outcome::ProcessDied;
    result.exit_status = state->died;
    result.error_message =
        "process terminated during execution (" + state->died->describe() +
        ")";
    LOG_WARN("CALL", label, "{}", result.error_message);
    return result;
  }

  result.parsed_response = ipc::find_first_json(result.raw_output, match_id);
  LOG_DEBUG("CALL", label, "Collected {} bytes stdout, {} bytes stderr",
            result.raw_output.size(), result.error_output.size());
  return result;
}

CallResult
RequestCorrelator::call_tool(const std::shared_ptr<ipc::ChildProcess> &process,
                             const std::string &tool,
                             const nlohmann::json &arguments,
                             std::chrono::milliseconds timeout) {
  const int64_t id = ids_.next();
  return call(process, ipc::build_tool_call(id, tool, arguments), timeout);
}

CallResult
RequestCorrelator::call_raw(const std::shared_ptr<ipc::ChildProcess> &process,
                            const std::string &raw_input,
                            std::chrono::milliseconds timeout) {
  return call(process, ipc::ensure_line(raw_input), timeout);
}

CallResult RequestCorrelator::fetch_details(
    const std::shared_ptr<ipc::ChildProcess> &process,
    std::chrono::milliseconds timeout) {
  const int64_t id = ids_.next();
  return call(process, ipc::build_tools_list(id), timeout, id);
}

} // namespace server
} // namespace mcphub
