#include "mcp-hub/ipc/ProcessManager.hpp"
#include "mcp-hub/Logger.hpp"

#include <csignal>
#include <cstring>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/stat.h>
#include <unistd.h>
extern char **environ;

namespace mcphub {
namespace ipc {

namespace {

// Host variables a child may inherit. Everything else is dropped.
constexpr const char *INHERITED_ENV[] = {
    // search path and user identity
    "PATH", "HOME", "USER", "LOGNAME", "SHELL",
    // temp and per-user directories
    "TMPDIR", "TEMP", "TMP", "XDG_RUNTIME_DIR", "XDG_CACHE_HOME",
    "XDG_CONFIG_HOME", "XDG_DATA_HOME", "APPDATA", "LOCALAPPDATA",
    "USERPROFILE", "SYSTEMROOT", "COMSPEC", "PATHEXT",
    // package manager caches and registries
    "npm_config_cache", "NPM_CONFIG_CACHE", "npm_config_registry",
    "NPM_CONFIG_REGISTRY", "npm_config_prefix", "PIP_CACHE_DIR",
    "UV_CACHE_DIR",
    // proxies
    "HTTP_PROXY", "HTTPS_PROXY", "NO_PROXY", "http_proxy", "https_proxy",
    "no_proxy",
    // locale
    "LANG", "LANGUAGE", "LC_ALL", "LC_CTYPE", "TZ"};

constexpr const char *PACKAGE_RUNNERS[] = {
    "npx", "npm", "pnpm", "yarn", "uvx", "bunx"};

constexpr std::chrono::milliseconds FORCE_KILL_WAIT{2000};

#ifdef _WIN32
constexpr bool WINDOWS_HOST = true;
#else
constexpr bool WINDOWS_HOST = false;
#endif

void ignore_sigpipe_once() {
  static std::once_flag flag;
  // Writes to a dead child's stdin must fail with EPIPE, not kill the server
  std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_pipe(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      ::close(fds[i]);
      fds[i] = -1;
    }
  }
}

} // namespace

ProcessManager::ProcessManager(std::chrono::milliseconds termination_grace)
    : grace_(termination_grace) {
  ignore_sigpipe_once();
  monitor_running_ = true;
  monitor_thread_ = std::thread([this]() { escalation_loop(); });
}

ProcessManager::~ProcessManager() {
  cleanup_all();
  monitor_running_ = false;
  cv_.notify_all();
  if (monitor_thread_.joinable()) {
    monitor_thread_.join();
  }
}

std::shared_ptr<ChildProcess>
ProcessManager::spawn(const LaunchConfig &requested, const std::string &label) {
  LaunchConfig config = rewrite_for_platform(requested, WINDOWS_HOST);

  Environment env = build_child_environment(host_environment(), config.env);

  std::string executable = config.command;
  if (executable.find('/') == std::string::npos) {
    auto path_it = env.find("PATH");
    auto resolved = find_executable(
        executable, path_it != env.end() ? path_it->second : std::string());
    if (!resolved) {
      LOG_ERROR("PROCESS", label, "Command not found: {}", config.command);
      throw SpawnError("command not found: " + config.command);
    }
    executable = *resolved;
  }

  LOG_INFO("PROCESS", label, "Spawning: {} ({} args)", executable,
           config.args.size());

  std::vector<std::string> argv_storage;
  argv_storage.push_back(config.command);
  argv_storage.insert(argv_storage.end(), config.args.begin(),
                      config.args.end());
  std::vector<char *> argv;
  for (auto &arg : argv_storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::vector<std::string> env_storage;
  for (const auto &[name, value] : env) {
    env_storage.push_back(name + "=" + value);
  }
  std::vector<char *> envp;
  for (auto &entry : env_storage) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(err_pipe, O_CLOEXEC) != 0) {
    std::string reason = strerror(errno);
    close_pipe(in_pipe);
    close_pipe(out_pipe);
    close_pipe(err_pipe);
    throw SpawnError("failed to create pipes: " + reason);
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

  // The server ignores SIGPIPE; children get default dispositions back
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  sigaddset(&default_signals, SIGTERM);
  sigaddset(&default_signals, SIGINT);
  posix_spawnattr_setsigdefault(&attr, &default_signals);
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  posix_spawnattr_setsigmask(&attr, &empty_mask);
  posix_spawnattr_setflags(&attr,
                           POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

  pid_t pid = 0;
  int status = posix_spawn(&pid, executable.c_str(), &actions, &attr,
                           argv.data(), envp.data());

  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);

  // Child ends belong to the child now
  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  if (status != 0) {
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    LOG_ERROR("PROCESS", label, "posix_spawn failed: {}", strerror(status));
    throw SpawnError("failed to spawn '" + config.command +
                     "': " + strerror(status));
  }
  if (pid <= 0) {
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    throw SpawnError("no process id assigned for '" + config.command + "'");
  }

  auto child = std::make_shared<ChildProcess>(pid, in_pipe[1], out_pipe[0],
                                              err_pipe[0], label);
  child->start_reader();

  LOG_INFO("PROCESS", label, "Spawned successfully: PID={}", pid);
  return child;
}

void ProcessManager::terminate(const std::shared_ptr<ChildProcess> &process) {
  if (!process || !process->is_alive()) {
    return;
  }

  ProcessId pid = process->pid();
  {
    std::lock_guard lock(mutex_);
    if (pending_.count(pid)) {
      return;
    }
    PendingTermination pending;
    pending.process = process;
    pending.deadline = std::chrono::steady_clock::now() + grace_;
    pending_.emplace(pid, std::move(pending));
  }

  // Registered outside the lock: fires inline if the child is already gone
  auto listener_id =
      process->add_exit_listener([this, pid](const ExitStatus &) { on_exit(pid); });
  {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(pid);
    if (it != pending_.end()) {
      it->second.exit_listener = listener_id;
    }
  }

  LOG_INFO("PROCESS", process->label(), "Sending SIGTERM to PID={}", pid);
  if (!process->send_signal(SIGTERM)) {
    LOG_DEBUG("PROCESS", process->label(), "SIGTERM not delivered to PID={}",
              pid);
  }
  cv_.notify_all();
}

bool ProcessManager::terminate_and_wait(
    const std::shared_ptr<ChildProcess> &process) {
  if (!process) {
    return true;
  }
  terminate(process);
  return process->wait_for_exit(grace_ + FORCE_KILL_WAIT);
}

bool ProcessManager::wait_for_retired(const std::string &label,
                                      std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [this, &label] {
    for (const auto &[pid, pending] : pending_) {
      if (pending.process->label() == label) {
        return false;
      }
    }
    return true;
  });
}

size_t ProcessManager::pending_terminations() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

void ProcessManager::on_exit(ProcessId pid) {
  std::shared_ptr<ChildProcess> released;
  {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(pid);
    if (it == pending_.end()) {
      return;
    }
    released = std::move(it->second.process);
    pending_.erase(it);
  }
  cv_.notify_all();
  LOG_DEBUG("PROCESS", released->label(), "Termination of PID={} complete",
            pid);
}

void ProcessManager::cleanup_all() {
  std::map<ProcessId, PendingTermination> pending;
  {
    std::lock_guard lock(mutex_);
    pending.swap(pending_);
  }
  if (!pending.empty()) {
    LOG_INFO("PROCESS", "CLEANUP", "Force killing {} terminating processes",
             pending.size());
  }

  for (auto &[pid, entry] : pending) {
    entry.process->remove_exit_listener(entry.exit_listener);
    entry.process->send_signal(SIGKILL);
    entry.process->wait_for_exit(FORCE_KILL_WAIT);
  }
  cv_.notify_all();
}

void ProcessManager::escalation_loop() {
  while (monitor_running_) {
    std::vector<std::shared_ptr<ChildProcess>> overdue;
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, std::chrono::milliseconds(100));
      if (!monitor_running_) {
        break;
      }

      auto now = std::chrono::steady_clock::now();
      for (auto &[pid, pending] : pending_) {
        if (!pending.forced && now >= pending.deadline) {
          pending.forced = true;
          overdue.push_back(pending.process);
        }
      }
    }

    for (const auto &process : overdue) {
      if (!process->is_alive()) {
        continue;
      }
      LOG_WARN("PROCESS", process->label(),
               "PID={} ignored SIGTERM for {}ms, sending SIGKILL",
               process->pid(), grace_.count());
      process->send_signal(SIGKILL);
    }
  }
}

ProcessManager::Environment ProcessManager::host_environment() {
  Environment env;
  for (char **entry = environ; entry && *entry; ++entry) {
    std::string kv(*entry);
    auto eq = kv.find('=');
    if (eq == std::string::npos || eq == 0) {
      continue;
    }
    env.emplace(kv.substr(0, eq), kv.substr(eq + 1));
  }
  return env;
}

ProcessManager::Environment
ProcessManager::build_child_environment(const Environment &host,
                                        const Environment &overrides) {
  Environment env;
  for (const char *name : INHERITED_ENV) {
    auto it = host.find(name);
    if (it != host.end()) {
      env[it->first] = it->second;
    }
  }
  for (const auto &[name, value] : overrides) {
    env[name] = value;
  }
  return env;
}

LaunchConfig ProcessManager::rewrite_for_platform(const LaunchConfig &config,
                                                  bool windows_host) {
  if (!windows_host) {
    return config;
  }
  for (const char *runner : PACKAGE_RUNNERS) {
    if (config.command == runner) {
      LaunchConfig rewritten = config;
      rewritten.command = "cmd";
      rewritten.args.clear();
      rewritten.args.push_back("/c");
      rewritten.args.push_back(config.command);
      rewritten.args.insert(rewritten.args.end(), config.args.begin(),
                            config.args.end());
      return rewritten;
    }
  }
  return config;
}

std::optional<std::string>
ProcessManager::find_executable(const std::string &name,
                                const std::string &path) {
  std::istringstream dirs(path);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    std::string candidate = dir + "/" + name;
    struct stat st;
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace ipc
} // namespace mcphub
