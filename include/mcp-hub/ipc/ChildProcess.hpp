#pragma once
#include "mcp-hub/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <sys/types.h>

namespace mcphub {
namespace ipc {

using ProcessId = pid_t;

enum class StreamKind { Stdout, Stderr };

/// A spawned child with its three stdio pipes. Output is pumped by a reader
/// thread and fanned out to listeners; exit is detected by the same thread.
/// Instances are always owned through std::shared_ptr (see ProcessManager).
class ChildProcess : public std::enable_shared_from_this<ChildProcess> {
public:
  using OutputListener =
      std::function<void(StreamKind stream, const std::string &chunk)>;
  using ExitListener = std::function<void(const ExitStatus &status)>;
  using ListenerId = uint64_t;

  /// Detaches its listener when destroyed, on every exit path
  class ScopedListener {
  public:
    ScopedListener() = default;
    ScopedListener(std::shared_ptr<ChildProcess> process, ListenerId id,
                   bool is_exit)
        : process_(std::move(process)), id_(id), is_exit_(is_exit) {}
    ~ScopedListener() { reset(); }

    ScopedListener(const ScopedListener &) = delete;
    ScopedListener &operator=(const ScopedListener &) = delete;
    ScopedListener(ScopedListener &&other) noexcept;
    ScopedListener &operator=(ScopedListener &&other) noexcept;

    void reset();

  private:
    std::shared_ptr<ChildProcess> process_;
    ListenerId id_{0};
    bool is_exit_{false};
  };

  ChildProcess(ProcessId pid, int stdin_fd, int stdout_fd, int stderr_fd,
               std::string label);
  ~ChildProcess();

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  /// Start the reader thread. Called once by ProcessManager after wrapping
  /// the instance in a shared_ptr.
  void start_reader();

  /// Write to stdin. With a zero timeout the write is rejected as soon as the
  /// pipe would block. Returns false on a closed pipe or dead process.
  bool write(const std::string &data,
             std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  ListenerId add_output_listener(OutputListener listener);
  void remove_output_listener(ListenerId id);

  /// Registers an exit listener. If the process already exited the listener
  /// is invoked immediately on the calling thread.
  ListenerId add_exit_listener(ExitListener listener);
  void remove_exit_listener(ListenerId id);

  ScopedListener scoped_output_listener(OutputListener listener);
  ScopedListener scoped_exit_listener(ExitListener listener);

  /// Liveness flag: false once the child has been reaped
  bool is_alive() const { return alive_.load(); }

  /// OS-level probe (kill(pid, 0)); detects zombies
  bool probe() const;

  /// True once terminate/kill was requested for this child
  bool kill_requested() const { return kill_requested_.load(); }

  /// Send a signal to the child (SIGTERM/SIGKILL)
  bool send_signal(int sig);

  /// Block until the child exits or `timeout` elapses
  bool wait_for_exit(std::chrono::milliseconds timeout);

  std::optional<ExitStatus> exit_status() const;

  ProcessId pid() const { return pid_; }
  const std::string &label() const { return label_; }
  std::chrono::steady_clock::time_point started_at() const {
    return started_at_;
  }

private:
  void reader_loop();
  void dispatch_output(StreamKind stream, const std::string &chunk);
  void record_exit(int wait_status);
  void fire_exit_listeners();
  void drain_output(bool &stdout_open, bool &stderr_open, int timeout_ms);

  ProcessId pid_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;
  std::string label_;
  std::chrono::steady_clock::time_point started_at_;

  std::atomic<bool> alive_{true};
  std::atomic<bool> kill_requested_{false};
  std::atomic<bool> stop_reader_{false};
  std::thread reader_thread_;

  std::mutex write_mutex_;

  mutable std::mutex state_mutex_;
  std::condition_variable exit_cv_;
  std::optional<ExitStatus> exit_status_;

  std::mutex listener_mutex_;
  bool exit_dispatched_{false};
  std::map<ListenerId, OutputListener> output_listeners_;
  std::map<ListenerId, ExitListener> exit_listeners_;
  ListenerId next_listener_id_{1};
};

} // namespace ipc
} // namespace mcphub
