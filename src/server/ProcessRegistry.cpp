#include "mcp-hub/server/ProcessRegistry.hpp"
#include "mcp-hub/Logger.hpp"
#include "mcp-hub/Redaction.hpp"

namespace mcphub {
namespace server {

namespace {

constexpr auto RETIRE_SLACK = std::chrono::seconds(2);

// Heartbeats are skipped for entries pinged within this fraction of the
// interval, so a slow sweep never pings twice in one period.
constexpr double HEARTBEAT_SKIP_FRACTION = 0.8;

} // namespace

ProcessRegistry::ProcessRegistry(RegistryOptions options)
    : options_(std::move(options)), anchor_(std::make_shared<Anchor>()),
      supervisor_(options_.termination_grace),
      handshake_(ids_, options_.client_name, options_.client_version,
                 options_.handshake_timeout),
      correlator_(ids_) {
  anchor_->owner = this;
}

ProcessRegistry::~ProcessRegistry() {
  stop_background_tasks();
  shutdown_all();
  std::lock_guard lock(anchor_->mutex);
  anchor_->owner = nullptr;
}

bool ProcessRegistry::is_usable(const Entry &entry) {
  return entry.process->is_alive() && !entry.process->kill_requested() &&
         !entry.communication_failed;
}

EnsureResult ProcessRegistry::ensure_process(
    const std::string &client_id, const std::string &server_name,
    const LaunchConfig &config, std::optional<std::chrono::milliseconds> ttl) {
  const std::string key = make_key(client_id, server_name);
  const std::string fingerprint = config.fingerprint();
  const auto effective_ttl = ttl.value_or(options_.default_ttl);

  std::promise<EnsureResult> promise;
  std::optional<InFlight> pending;
  {
    std::lock_guard lock(mutex_);
    auto in_flight = in_flight_.find(key);
    if (in_flight != in_flight_.end()) {
      pending = in_flight->second;
    } else {
      auto it = entries_.find(key);
      if (it != entries_.end() && is_usable(*it->second) &&
          it->second->initialized && it->second->fingerprint == fingerprint) {
        auto &entry = *it->second;
        entry.last_accessed_at = std::chrono::system_clock::now();
        LOG_DEBUG("REGISTRY", key, "Reusing process (pid {})",
                  entry.process->pid());
        return EnsureResult{entry.process, true, key, true};
      }
      in_flight_[key] = InFlight{promise.get_future().share(), fingerprint};
    }
  }

  if (pending) {
    LOG_DEBUG("REGISTRY", key, "Awaiting in-flight startup");
    EnsureResult result = pending->result.get();
    if (pending->fingerprint != fingerprint) {
      // The in-flight start used another config; supersede it now
      return ensure_process(client_id, server_name, config, ttl);
    }
    result.was_already_running = true;
    return result;
  }

  try {
    EnsureResult result = start_or_reuse(key, client_id, server_name, config,
                                         fingerprint, effective_ttl);
    promise.set_value(result);
    std::lock_guard lock(mutex_);
    in_flight_.erase(key);
    return result;
  } catch (...) {
    promise.set_exception(std::current_exception());
    {
      std::lock_guard lock(mutex_);
      in_flight_.erase(key);
    }
    throw;
  }
}

EnsureResult ProcessRegistry::start_or_reuse(const std::string &key,
                                             const std::string &client_id,
                                             const std::string &server_name,
                                             const LaunchConfig &config,
                                             const std::string &fingerprint,
                                             std::chrono::milliseconds ttl) {
  std::shared_ptr<Entry> existing;
  {
    std::lock_guard lock(mutex_);
    killed_.erase(key);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      existing = it->second;
      if (is_usable(*existing) && existing->fingerprint == fingerprint &&
          existing->initialized) {
        existing->last_accessed_at = std::chrono::system_clock::now();
        return EnsureResult{existing->process, true, key, true};
      }
    }
  }

  if (existing) {
    bool usable = false;
    {
      std::lock_guard lock(mutex_);
      usable = is_usable(*existing);
    }
    if (usable && existing->fingerprint == fingerprint) {
      LOG_INFO("REGISTRY", key,
               "Process running but not initialized, retrying handshake");
      {
        std::lock_guard lock(mutex_);
        existing->last_accessed_at = std::chrono::system_clock::now();
      }
      bool ok = initialize_entry(existing);
      return EnsureResult{existing->process, true, key, ok};
    }

    if (usable) {
      LOG_INFO("REGISTRY", key, "Launch config changed, replacing pid {}",
               existing->process->pid());
    } else {
      LOG_INFO("REGISTRY", key, "Replacing dead process (pid {})",
               existing->process->pid());
    }
    {
      std::lock_guard lock(mutex_);
      auto it = entries_.find(key);
      if (it != entries_.end() && it->second == existing) {
        entries_.erase(it);
      }
    }
    supervisor_.terminate_and_wait(existing->process);
  }

  if (!supervisor_.wait_for_retired(key, options_.termination_grace +
                                             RETIRE_SLACK)) {
    LOG_WARN("REGISTRY", key, "Previous process still retiring");
  }

  std::shared_ptr<ipc::ChildProcess> process;
  try {
    process = supervisor_.spawn(config, key);
  } catch (const SpawnError &e) {
    LOG_ERROR("REGISTRY", key, "Spawn failed: {}", e.what());
    observers_.publish(LifecycleEvent{LifecycleEventType::Error, key,
                                      client_id, server_name, std::nullopt,
                                      e.what()});
    throw;
  }

  auto entry = std::make_shared<Entry>();
  entry->key = key;
  entry->client_id = client_id;
  entry->server_name = server_name;
  entry->process = process;
  entry->config = config;
  entry->fingerprint = fingerprint;
  entry->ttl = ttl;
  entry->last_accessed_at = std::chrono::system_clock::now();
  {
    std::lock_guard lock(mutex_);
    entries_[key] = entry;
  }

  std::weak_ptr<Entry> weak_entry = entry;
  process->add_exit_listener([anchor = anchor_, key, weak_entry, client_id,
                              server_name](const ExitStatus &status) {
    std::lock_guard lock(anchor->mutex);
    if (anchor->owner) {
      anchor->owner->on_process_exit(key, weak_entry, client_id, server_name,
                                     status);
    }
  });

  LOG_INFO("REGISTRY", key, "Started {} (pid {})",
           redacted_command_line(config), process->pid());

  bool ok = initialize_entry(entry);
  return EnsureResult{process, false, key, ok};
}

bool ProcessRegistry::initialize_entry(const std::shared_ptr<Entry> &entry) {
  const bool ok = handshake_.initialize(entry->process);
  {
    std::lock_guard lock(mutex_);
    if (ok) {
      entry->initialized = true;
      entry->last_accessed_at = std::chrono::system_clock::now();
    }
  }
  if (ok) {
    observers_.publish(LifecycleEvent{LifecycleEventType::Initialized,
                                      entry->key, entry->client_id,
                                      entry->server_name, std::nullopt, ""});
  } else {
    LOG_WARN("REGISTRY", entry->key,
             "Initialization failed, keeping process for retry");
    observers_.publish(LifecycleEvent{
        LifecycleEventType::InitializationFailed, entry->key,
        entry->client_id, entry->server_name, std::nullopt,
        "initialization handshake did not complete"});
  }
  return ok;
}

void ProcessRegistry::on_process_exit(const std::string &key,
                                      const std::weak_ptr<Entry> &entry,
                                      const std::string &client_id,
                                      const std::string &server_name,
                                      const ExitStatus &status) {
  bool evicted = false;
  if (auto current = entry.lock()) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second == current) {
      entries_.erase(it);
      evicted = true;
    }
  }
  LOG_INFO("REGISTRY", key, "Process exited ({}){}", status.describe(),
           evicted ? ", entry removed" : "");
  observers_.publish(LifecycleEvent{LifecycleEventType::Exited, key, client_id,
                                    server_name, status, status.describe()});
}

std::shared_ptr<ipc::ChildProcess>
ProcessRegistry::get_process(const std::string &client_id,
                             const std::string &server_name) {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(make_key(client_id, server_name));
  if (it == entries_.end() || !is_usable(*it->second)) {
    return nullptr;
  }
  it->second->last_accessed_at = std::chrono::system_clock::now();
  return it->second->process;
}

bool ProcessRegistry::has_process(const std::string &client_id,
                                  const std::string &server_name) const {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(make_key(client_id, server_name));
  return it != entries_.end() && is_usable(*it->second);
}

bool ProcessRegistry::is_initialized(const std::string &client_id,
                                     const std::string &server_name) const {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(make_key(client_id, server_name));
  return it != entries_.end() && it->second->initialized;
}

void ProcessRegistry::mark_initialized(const std::string &client_id,
                                       const std::string &server_name) {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(make_key(client_id, server_name));
  if (it != entries_.end()) {
    it->second->initialized = true;
  }
}

HealthStatus ProcessRegistry::is_healthy(const std::string &client_id,
                                         const std::string &server_name) const {
  const std::string key = make_key(client_id, server_name);
  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    if (killed_.count(key)) {
      return {false, HealthReason::Killed};
    }
    return {false, HealthReason::NotFound};
  }
  const Entry &entry = *it->second;
  if (!is_usable(entry)) {
    return {false, HealthReason::Killed};
  }
  if (!entry.initialized) {
    return {false, HealthReason::NotInitialized};
  }
  if (!entry.process->probe()) {
    return {false, HealthReason::Zombie};
  }
  return {true, HealthReason::None};
}

ProcessSummary ProcessRegistry::summarize(const Entry &entry) const {
  LaunchConfig masked = redact(entry.config);
  ProcessSummary summary;
  summary.key = entry.key;
  summary.client_id = entry.client_id;
  summary.server_name = entry.server_name;
  summary.pid = entry.process->pid();
  summary.initialized = entry.initialized;
  summary.last_accessed_at = entry.last_accessed_at;
  summary.last_heartbeat_at = entry.last_heartbeat_at;
  summary.ttl = entry.ttl;
  summary.command_line = redacted_command_line(entry.config);
  summary.config = masked.to_json();
  return summary;
}

std::vector<ProcessSummary>
ProcessRegistry::list_for_client(const std::string &client_id) const {
  std::vector<ProcessSummary> result;
  std::lock_guard lock(mutex_);
  for (const auto &[key, entry] : entries_) {
    if (entry->client_id == client_id && is_usable(*entry)) {
      result.push_back(summarize(*entry));
    }
  }
  return result;
}

std::vector<ProcessSummary> ProcessRegistry::list_all() const {
  std::vector<ProcessSummary> result;
  std::lock_guard lock(mutex_);
  for (const auto &[key, entry] : entries_) {
    if (is_usable(*entry)) {
      result.push_back(summarize(*entry));
    }
  }
  return result;
}

bool ProcessRegistry::kill_process(const std::string &client_id,
                                   const std::string &server_name) {
  const std::string key = make_key(client_id, server_name);
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return false;
    }
    entry = it->second;
    entries_.erase(it);
    if (!entry->process->is_alive() || entry->process->kill_requested()) {
      return false;
    }
    killed_[key] = std::chrono::system_clock::now();
  }
  LOG_INFO("REGISTRY", key, "Killing pid {}", entry->process->pid());
  supervisor_.terminate(entry->process);
  return true;
}

void ProcessRegistry::shutdown_all() {
  std::map<std::string, std::shared_ptr<Entry>> entries;
  {
    std::lock_guard lock(mutex_);
    entries.swap(entries_);
  }
  if (entries.empty()) {
    return;
  }
  LOG_INFO("REGISTRY", "shutdown", "Terminating {} process(es)",
           entries.size());
  for (const auto &[key, entry] : entries) {
    supervisor_.terminate(entry->process);
  }
  for (const auto &[key, entry] : entries) {
    if (!entry->process->wait_for_exit(options_.termination_grace +
                                       RETIRE_SLACK)) {
      LOG_ERROR("REGISTRY", key, "pid {} did not exit during shutdown",
                entry->process->pid());
    }
  }
}

size_t ProcessRegistry::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

void ProcessRegistry::note_call_result(
    const std::shared_ptr<ipc::ChildProcess> &process,
    const CallResult &result) {
  if (result.outcome != CallResult::Outcome::CommunicationError) {
    return;
  }
  std::lock_guard lock(mutex_);
  for (auto &[key, entry] : entries_) {
    if (entry->process == process) {
      LOG_WARN("REGISTRY", key, "Marking process unusable: {}",
               result.error_message);
      entry->communication_failed = true;
    }
  }
}

CallResult
ProcessRegistry::call_tool(const std::shared_ptr<ipc::ChildProcess> &process,
                           const std::string &tool,
                           const nlohmann::json &arguments,
                           std::chrono::milliseconds timeout) {
  CallResult result = correlator_.call_tool(process, tool, arguments, timeout);
  note_call_result(process, result);
  return result;
}

CallResult
ProcessRegistry::call_raw(const std::shared_ptr<ipc::ChildProcess> &process,
                          const std::string &raw_input,
                          std::chrono::milliseconds timeout) {
  CallResult result = correlator_.call_raw(process, raw_input, timeout);
  note_call_result(process, result);
  return result;
}

CallResult ProcessRegistry::fetch_details(
    const std::shared_ptr<ipc::ChildProcess> &process,
    std::chrono::milliseconds timeout) {
  CallResult result = correlator_.fetch_details(process, timeout);
  note_call_result(process, result);
  return result;
}

size_t ProcessRegistry::sweep_expired() {
  const auto now = std::chrono::system_clock::now();
  std::vector<std::shared_ptr<Entry>> expired;
  {
    std::lock_guard lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      const Entry &entry = *it->second;
      if (std::chrono::duration_cast<std::chrono::milliseconds>(
              now - entry.last_accessed_at) > entry.ttl) {
        expired.push_back(it->second);
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
    for (auto it = killed_.begin(); it != killed_.end();) {
      if (std::chrono::duration_cast<std::chrono::milliseconds>(
              now - it->second) > options_.default_ttl) {
        it = killed_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (const auto &entry : expired) {
    try {
      LOG_INFO("SWEEP", entry->key, "Idle for longer than {} ms, terminating",
               entry->ttl.count());
      supervisor_.terminate(entry->process);
      observers_.publish(LifecycleEvent{LifecycleEventType::IdleTimeout,
                                        entry->key, entry->client_id,
                                        entry->server_name, std::nullopt,
                                        "idle timeout"});
    } catch (const std::exception &e) {
      LOG_ERROR("SWEEP", entry->key, "Failed to terminate: {}", e.what());
    }
  }
  return expired.size();
}

size_t ProcessRegistry::send_heartbeats() {
  const auto now = std::chrono::system_clock::now();
  const auto skip_window =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          options_.heartbeat_interval * HEARTBEAT_SKIP_FRACTION);

  std::vector<std::shared_ptr<Entry>> due;
  {
    std::lock_guard lock(mutex_);
    for (const auto &[key, entry] : entries_) {
      if (!is_usable(*entry) || !entry->initialized) {
        continue;
      }
      if (entry->last_heartbeat_at &&
          now - *entry->last_heartbeat_at < skip_window) {
        continue;
      }
      due.push_back(entry);
    }
  }

  size_t pinged = 0;
  for (const auto &entry : due) {
    try {
      if (handshake_.ping(entry->process)) {
        std::lock_guard lock(mutex_);
        entry->last_heartbeat_at = std::chrono::system_clock::now();
        ++pinged;
      }
    } catch (const std::exception &e) {
      LOG_ERROR("HEARTBEAT", entry->key, "Ping failed: {}", e.what());
    }
  }
  return pinged;
}

void ProcessRegistry::background_loop(std::chrono::milliseconds interval,
                                      bool heartbeat) {
  std::unique_lock lock(background_mutex_);
  while (background_running_) {
    if (background_cv_.wait_for(lock, interval,
                                [this] { return !background_running_; })) {
      break;
    }
    lock.unlock();
    try {
      if (heartbeat) {
        send_heartbeats();
      } else {
        sweep_expired();
      }
    } catch (const std::exception &e) {
      LOG_ERROR("REGISTRY", heartbeat ? "heartbeat" : "sweep",
                "Background pass failed: {}", e.what());
    }
    lock.lock();
  }
}

void ProcessRegistry::start_background_tasks() {
  std::lock_guard lock(background_mutex_);
  if (background_running_) {
    return;
  }
  background_running_ = true;
  sweep_thread_ = std::thread(
      [this] { background_loop(options_.sweep_interval, false); });
  heartbeat_thread_ = std::thread(
      [this] { background_loop(options_.heartbeat_interval, true); });
  LOG_INFO("REGISTRY", "background",
           "Sweep every {} ms, heartbeat every {} ms",
           options_.sweep_interval.count(),
           options_.heartbeat_interval.count());
}

void ProcessRegistry::stop_background_tasks() {
  {
    std::lock_guard lock(background_mutex_);
    if (!background_running_) {
      return;
    }
    background_running_ = false;
  }
  background_cv_.notify_all();
  if (sweep_thread_.joinable()) {
    sweep_thread_.join();
  }
  if (heartbeat_thread_.joinable()) {
    heartbeat_thread_.join();
  }
}

LifecycleObservers::SubscriptionId
ProcessRegistry::subscribe(LifecycleObservers::Observer observer) {
  return observers_.subscribe(std::move(observer));
}

void ProcessRegistry::unsubscribe(LifecycleObservers::SubscriptionId id) {
  observers_.unsubscribe(id);
}

} // namespace server
} // namespace mcphub
