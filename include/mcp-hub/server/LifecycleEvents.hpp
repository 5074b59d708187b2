#pragma once
#include "mcp-hub/types.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mcphub {
namespace server {

enum class LifecycleEventType {
  IdleTimeout,
  Exited,
  Error,
  Initialized,
  InitializationFailed
};

std::string to_string(LifecycleEventType type);

struct LifecycleEvent {
  LifecycleEventType type;
  std::string key;
  std::string client_id;
  std::string server_name;
  std::optional<ExitStatus> exit_status; // Exited only
  std::string message;
};

/// Observer list for lifecycle notifications. Observers run on the thread
/// that produced the event and must not block.
class LifecycleObservers {
public:
  using Observer = std::function<void(const LifecycleEvent &)>;
  using SubscriptionId = uint64_t;

  SubscriptionId subscribe(Observer observer);
  void unsubscribe(SubscriptionId id);
  void publish(const LifecycleEvent &event) const;

private:
  mutable std::mutex mutex_;
  std::map<SubscriptionId, Observer> observers_;
  SubscriptionId next_id_{1};
};

} // namespace server
} // namespace mcphub
