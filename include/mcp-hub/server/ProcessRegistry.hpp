#pragma once
#include "mcp-hub/ipc/ChildProcess.hpp"
#include "mcp-hub/ipc/JsonRpc.hpp"
#include "mcp-hub/ipc/ProcessManager.hpp"
#include "mcp-hub/server/HandshakeEngine.hpp"
#include "mcp-hub/server/LifecycleEvents.hpp"
#include "mcp-hub/server/RequestCorrelator.hpp"
#include "mcp-hub/types.hpp"
#include "mcp-hub/version.hpp"

#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcphub {
namespace server {

struct RegistryOptions {
  std::chrono::milliseconds default_ttl{std::chrono::minutes(15)};
  std::chrono::milliseconds sweep_interval{std::chrono::minutes(1)};
  std::chrono::milliseconds heartbeat_interval{std::chrono::minutes(5)};
  std::chrono::milliseconds handshake_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds termination_grace{std::chrono::seconds(8)};
  std::string client_name{SERVICE_NAME};
  std::string client_version{VERSION};
};

struct EnsureResult {
  std::shared_ptr<ipc::ChildProcess> process;
  bool was_already_running{false};
  std::string key;
  bool initialized{false};
};

/// Owns every supervised child, keyed by "<clientId>:<serverName>".
/// At most one live process exists per key; concurrent starts for the same
/// key share one in-flight operation.
class ProcessRegistry {
public:
  explicit ProcessRegistry(RegistryOptions options = {});
  ~ProcessRegistry();

  ProcessRegistry(const ProcessRegistry &) = delete;
  ProcessRegistry &operator=(const ProcessRegistry &) = delete;

  /// Reuse a live, initialized process with the same launch config or start
  /// (and initialize) a new one. Blocks until the handshake settles.
  /// Throws SpawnError when the child cannot be created.
  EnsureResult ensure_process(const std::string &client_id,
                              const std::string &server_name,
                              const LaunchConfig &config,
                              std::optional<std::chrono::milliseconds> ttl =
                                  std::nullopt);

  /// Live process for the key (refreshes its idle timer), or nullptr
  std::shared_ptr<ipc::ChildProcess> get_process(const std::string &client_id,
                                                 const std::string &server_name);

  bool has_process(const std::string &client_id,
                   const std::string &server_name) const;

  bool is_initialized(const std::string &client_id,
                      const std::string &server_name) const;

  void mark_initialized(const std::string &client_id,
                        const std::string &server_name);

  HealthStatus is_healthy(const std::string &client_id,
                          const std::string &server_name) const;

  /// Redacted summaries of live processes
  std::vector<ProcessSummary> list_for_client(const std::string &client_id) const;
  std::vector<ProcessSummary> list_all() const;

  /// Evict and terminate. False when nothing live is registered.
  bool kill_process(const std::string &client_id,
                    const std::string &server_name);

  /// Terminate every child and wait for them to go away
  void shutdown_all();

  size_t size() const;

  CallResult call_tool(const std::shared_ptr<ipc::ChildProcess> &process,
                       const std::string &tool,
                       const nlohmann::json &arguments,
                       std::chrono::milliseconds timeout);
  CallResult call_raw(const std::shared_ptr<ipc::ChildProcess> &process,
                      const std::string &raw_input,
                      std::chrono::milliseconds timeout);
  CallResult fetch_details(const std::shared_ptr<ipc::ChildProcess> &process,
                           std::chrono::milliseconds timeout);

  /// One idle-expiry pass. Returns the number of entries evicted.
  size_t sweep_expired();

  /// One heartbeat pass. Returns the number of pings written.
  size_t send_heartbeats();

  void start_background_tasks();
  void stop_background_tasks();

  LifecycleObservers::SubscriptionId
  subscribe(LifecycleObservers::Observer observer);
  void unsubscribe(LifecycleObservers::SubscriptionId id);

  ipc::ProcessManager &process_manager() { return supervisor_; }
  const RegistryOptions &options() const { return options_; }

private:
  struct Entry {
    std::string key;
    std::string client_id;
    std::string server_name;
    std::shared_ptr<ipc::ChildProcess> process;
    LaunchConfig config;
    std::string fingerprint;
    std::chrono::milliseconds ttl{0};
    std::chrono::system_clock::time_point last_accessed_at;
    std::optional<std::chrono::system_clock::time_point> last_heartbeat_at;
    bool initialized{false};
    bool communication_failed{false};
  };

  struct InFlight {
    std::shared_future<EnsureResult> result;
    std::string fingerprint;
  };

  // Exit listeners reach the registry through this; cleared on destruction
  struct Anchor {
    std::recursive_mutex mutex;
    ProcessRegistry *owner{nullptr};
  };

  EnsureResult start_or_reuse(const std::string &key,
                              const std::string &client_id,
                              const std::string &server_name,
                              const LaunchConfig &config,
                              const std::string &fingerprint,
                              std::chrono::milliseconds ttl);
  bool initialize_entry(const std::shared_ptr<Entry> &entry);
  void on_process_exit(const std::string &key,
                       const std::weak_ptr<Entry> &entry,
                       const std::string &client_id,
                       const std::string &server_name,
                       const ExitStatus &status);
  void note_call_result(const std::shared_ptr<ipc::ChildProcess> &process,
                        const CallResult &result);
  void background_loop(std::chrono::milliseconds interval, bool heartbeat);

  // Caller holds mutex_
  static bool is_usable(const Entry &entry);
  ProcessSummary summarize(const Entry &entry) const;

  RegistryOptions options_;
  std::shared_ptr<Anchor> anchor_;
  ipc::ProcessManager supervisor_;
  ipc::RequestIdGenerator ids_;
  HandshakeEngine handshake_;
  RequestCorrelator correlator_;
  LifecycleObservers observers_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Entry>> entries_;
  std::map<std::string, InFlight> in_flight_;
  std::map<std::string, std::chrono::system_clock::time_point> killed_;

  std::mutex background_mutex_;
  std::condition_variable background_cv_;
  bool background_running_{false};
  std::thread sweep_thread_;
  std::thread heartbeat_thread_;
};

} // namespace server
} // namespace mcphub
