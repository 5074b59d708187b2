#pragma once
#include "mcp-hub/ipc/ChildProcess.hpp"
#include "mcp-hub/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mcphub {
namespace ipc {

/// Spawns child processes with piped stdio and terminates them safely
class ProcessManager {
public:
  using Environment = std::map<std::string, std::string>;

  explicit ProcessManager(
      std::chrono::milliseconds termination_grace = std::chrono::seconds(8));
  ~ProcessManager();

  ProcessManager(const ProcessManager &) = delete;
  ProcessManager &operator=(const ProcessManager &) = delete;

  /// Launch `config` without a shell. The child sees only the allow-listed
  /// host environment merged with `config.env`.
  /// Throws SpawnError if the OS refuses or no PID is assigned.
  std::shared_ptr<ChildProcess> spawn(const LaunchConfig &config,
                                      const std::string &label);

  /// SIGTERM now, SIGKILL once the grace window passes without an exit.
  /// Returns immediately; no-op for dead or already terminating children.
  void terminate(const std::shared_ptr<ChildProcess> &process);

  /// terminate() and block until the child is gone
  bool terminate_and_wait(const std::shared_ptr<ChildProcess> &process);

  /// Wait until no termination is pending for children labelled `label`
  bool wait_for_retired(const std::string &label,
                        std::chrono::milliseconds timeout);

  /// Number of children between SIGTERM and observed exit
  size_t pending_terminations() const;

  /// Force-kill everything still pending
  void cleanup_all();

  std::chrono::milliseconds termination_grace() const { return grace_; }

  /// Snapshot of the current process environment
  static Environment host_environment();

  /// Allow-listed subset of `host` (PATH, temp/user dirs, package-manager
  /// cache and proxy settings, locale) overlaid with `overrides`
  static Environment build_child_environment(const Environment &host,
                                             const Environment &overrides);

  /// Rewrite package-runner aliases (npx, npm, ...) into `cmd /c <alias>`
  /// on Windows hosts. Other commands pass through unchanged.
  static LaunchConfig rewrite_for_platform(const LaunchConfig &config,
                                           bool windows_host);

  /// Resolve `name` against a PATH-style list
  static std::optional<std::string> find_executable(const std::string &name,
                                                    const std::string &path);

private:
  struct PendingTermination {
    std::shared_ptr<ChildProcess> process;
    std::chrono::steady_clock::time_point deadline;
    ChildProcess::ListenerId exit_listener{0};
    bool forced{false};
  };

  void escalation_loop();
  void on_exit(ProcessId pid);

  std::chrono::milliseconds grace_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<ProcessId, PendingTermination> pending_;

  std::atomic<bool> monitor_running_{false};
  std::thread monitor_thread_;
};

} // namespace ipc
} // namespace mcphub
