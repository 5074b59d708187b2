#include "mcp-hub/ipc/ChildProcess.hpp"
#include "mcp-hub/Logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcphub {
namespace ipc {

namespace {
constexpr int POLL_INTERVAL_MS = 100;
constexpr size_t READ_CHUNK = 4096;

void set_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}
} // namespace

ChildProcess::ScopedListener::ScopedListener(ScopedListener &&other) noexcept
    : process_(std::move(other.process_)), id_(other.id_),
      is_exit_(other.is_exit_) {
  other.id_ = 0;
}

ChildProcess::ScopedListener &
ChildProcess::ScopedListener::operator=(ScopedListener &&other) noexcept {
  if (this != &other) {
    reset();
    process_ = std::move(other.process_);
    id_ = other.id_;
    is_exit_ = other.is_exit_;
    other.id_ = 0;
  }
  return *this;
}

void ChildProcess::ScopedListener::reset() {
  if (process_ && id_ != 0) {
    if (is_exit_) {
      process_->remove_exit_listener(id_);
    } else {
      process_->remove_output_listener(id_);
    }
  }
  process_.reset();
  id_ = 0;
}

ChildProcess::ChildProcess(ProcessId pid, int stdin_fd, int stdout_fd,
                           int stderr_fd, std::string label)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd), label_(std::move(label)),
      started_at_(std::chrono::steady_clock::now()) {
  // Non-blocking stdin lets write() detect backpressure
  set_nonblocking(stdin_fd_);
  set_nonblocking(stdout_fd_);
  set_nonblocking(stderr_fd_);
}

ChildProcess::~ChildProcess() {
  stop_reader_ = true;
  if (reader_thread_.joinable()) {
    if (reader_thread_.get_id() == std::this_thread::get_id()) {
      // Last reference dropped by an exit listener on the reader thread
      reader_thread_.detach();
    } else {
      reader_thread_.join();
    }
  }

  if (alive_) {
    // Never leave an orphan behind the handle
    ::kill(pid_, SIGKILL);
    int status = 0;
    ::waitpid(pid_, &status, 0);
    alive_ = false;
  }

  close_fd(stdin_fd_);
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
}

void ChildProcess::start_reader() {
  std::weak_ptr<ChildProcess> weak = weak_from_this();
  reader_thread_ = std::thread([this, weak]() {
    reader_loop();
    if (auto self = weak.lock()) {
      self->fire_exit_listeners();
    }
  });
}

void ChildProcess::reader_loop() {
  bool stdout_open = true;
  bool stderr_open = true;

  while (!stop_reader_) {
    if (stdout_open || stderr_open) {
      drain_output(stdout_open, stderr_open, POLL_INTERVAL_MS);
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
      // Pick up whatever the child wrote right before exiting
      for (int i = 0; i < 16 && (stdout_open || stderr_open); ++i) {
        drain_output(stdout_open, stderr_open, 0);
      }
      record_exit(status);
      return;
    }
    if (r < 0 && errno != EINTR) {
      LOG_ERROR("PROCESS", label_, "waitpid failed for PID={}: {}", pid_,
                strerror(errno));
      record_exit(-1);
      return;
    }
  }
}

void ChildProcess::drain_output(bool &stdout_open, bool &stderr_open,
                                int timeout_ms) {
  pollfd fds[2];
  StreamKind kinds[2];
  int n = 0;
  if (stdout_open) {
    fds[n] = {stdout_fd_, POLLIN, 0};
    kinds[n++] = StreamKind::Stdout;
  }
  if (stderr_open) {
    fds[n] = {stderr_fd_, POLLIN, 0};
    kinds[n++] = StreamKind::Stderr;
  }

  int rc = ::poll(fds, static_cast<nfds_t>(n), timeout_ms);
  if (rc <= 0) {
    return;
  }

  char buf[READ_CHUNK];
  for (int i = 0; i < n; ++i) {
    if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
      continue;
    }
    ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
    if (r > 0) {
      dispatch_output(kinds[i], std::string(buf, static_cast<size_t>(r)));
    } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
      bool &open = kinds[i] == StreamKind::Stdout ? stdout_open : stderr_open;
      open = false;
    }
  }
}

void ChildProcess::dispatch_output(StreamKind stream,
                                   const std::string &chunk) {
  std::vector<OutputListener> listeners;
  {
    std::lock_guard lock(listener_mutex_);
    listeners.reserve(output_listeners_.size());
    for (const auto &[id, listener] : output_listeners_) {
      listeners.push_back(listener);
    }
  }
  for (const auto &listener : listeners) {
    try {
      listener(stream, chunk);
    } catch (const std::exception &e) {
      LOG_ERROR("PROCESS", label_, "Output listener threw: {}", e.what());
    }
  }
}

void ChildProcess::record_exit(int wait_status) {
  ExitStatus status;
  if (wait_status >= 0) {
    if (WIFEXITED(wait_status)) {
      status.code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
      status.signal = WTERMSIG(wait_status);
    }
  }

  {
    std::lock_guard lock(state_mutex_);
    exit_status_ = status;
    alive_ = false;
  }
  exit_cv_.notify_all();

  LOG_DEBUG("PROCESS", label_, "Process PID={} exited ({})", pid_,
            status.describe());
}

void ChildProcess::fire_exit_listeners() {
  std::optional<ExitStatus> status = exit_status();
  if (!status) {
    return;
  }

  std::vector<ExitListener> listeners;
  {
    std::lock_guard lock(listener_mutex_);
    if (exit_dispatched_) {
      return;
    }
    exit_dispatched_ = true;
    for (auto &[id, listener] : exit_listeners_) {
      listeners.push_back(std::move(listener));
    }
    exit_listeners_.clear();
  }

  for (const auto &listener : listeners) {
    try {
      listener(*status);
    } catch (const std::exception &e) {
      LOG_ERROR("PROCESS", label_, "Exit listener threw: {}", e.what());
    }
  }
}

bool ChildProcess::write(const std::string &data,
                         std::chrono::milliseconds timeout) {
  if (!alive_) {
    return false;
  }

  std::lock_guard lock(write_mutex_);
  if (stdin_fd_ < 0) {
    return false;
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  size_t written = 0;
  while (written < data.size()) {
    ssize_t w =
        ::write(stdin_fd_, data.data() + written, data.size() - written);
    if (w > 0) {
      written += static_cast<size_t>(w);
      continue;
    }
    if (w < 0 && errno == EINTR) {
      continue;
    }
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        LOG_WARN("PROCESS", label_,
                 "stdin of PID={} would block ({} of {} bytes written)", pid_,
                 written, data.size());
        return false;
      }
      pollfd pfd{stdin_fd_, POLLOUT, 0};
      ::poll(&pfd, 1, static_cast<int>(remaining.count()));
      continue;
    }
    LOG_DEBUG("PROCESS", label_, "Write to PID={} failed: {}", pid_,
              strerror(errno));
    return false;
  }
  return true;
}

ChildProcess::ListenerId
ChildProcess::add_output_listener(OutputListener listener) {
  std::lock_guard lock(listener_mutex_);
  ListenerId id = next_listener_id_++;
  output_listeners_.emplace(id, std::move(listener));
  return id;
}

void ChildProcess::remove_output_listener(ListenerId id) {
  std::lock_guard lock(listener_mutex_);
  output_listeners_.erase(id);
}

ChildProcess::ListenerId
ChildProcess::add_exit_listener(ExitListener listener) {
  {
    std::lock_guard lock(listener_mutex_);
    if (!exit_dispatched_) {
      ListenerId id = next_listener_id_++;
      exit_listeners_.emplace(id, std::move(listener));
      return id;
    }
  }
  // Already exited: deliver right away
  if (auto status = exit_status()) {
    listener(*status);
  }
  return 0;
}

void ChildProcess::remove_exit_listener(ListenerId id) {
  std::lock_guard lock(listener_mutex_);
  exit_listeners_.erase(id);
}

ChildProcess::ScopedListener
ChildProcess::scoped_output_listener(OutputListener listener) {
  ListenerId id = add_output_listener(std::move(listener));
  return ScopedListener(shared_from_this(), id, false);
}

ChildProcess::ScopedListener
ChildProcess::scoped_exit_listener(ExitListener listener) {
  ListenerId id = add_exit_listener(std::move(listener));
  return ScopedListener(shared_from_this(), id, true);
}

bool ChildProcess::probe() const {
  if (!alive_) {
    return false;
  }
  return ::kill(pid_, 0) == 0;
}

bool ChildProcess::send_signal(int sig) {
  if (!alive_) {
    return false;
  }
  if (sig == SIGTERM || sig == SIGKILL) {
    kill_requested_ = true;
  }
  return ::kill(pid_, sig) == 0;
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
  std::unique_lock lock(state_mutex_);
  return exit_cv_.wait_for(lock, timeout,
                           [this] { return exit_status_.has_value(); });
}

std::optional<ExitStatus> ChildProcess::exit_status() const {
  std::lock_guard lock(state_mutex_);
  return exit_status_;
}

} // namespace ipc
} // namespace mcphub
