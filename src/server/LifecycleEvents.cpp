#include "mcp-hub/server/LifecycleEvents.hpp"
#include "mcp-hub/Logger.hpp"

#include <vector>

namespace mcphub {
namespace server {

std::string to_string(LifecycleEventType type) {
  switch (type) {
  case LifecycleEventType::IdleTimeout:
    return "process-timed-out-idle";
  case LifecycleEventType::Exited:
    return "process-exited";
  case LifecycleEventType::Error:
    return "process-error";
  case LifecycleEventType::Initialized:
    return "process-initialized";
  case LifecycleEventType::InitializationFailed:
    return "process-initialization-failed";
  }
  return "unknown";
}

LifecycleObservers::SubscriptionId
LifecycleObservers::subscribe(Observer observer) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  observers_.emplace(id, std::move(observer));
  return id;
}

void LifecycleObservers::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  observers_.erase(id);
}

void LifecycleObservers::publish(const LifecycleEvent &event) const {
  std::vector<Observer> observers;
  {
    std::lock_guard lock(mutex_);
    for (const auto &[id, observer] : observers_) {
      observers.push_back(observer);
    }
  }
  for (const auto &observer : observers) {
    try {
      observer(event);
    } catch (const std::exception &e) {
      LOG_ERROR("EVENTS", event.key, "Observer failed on {}: {}",
                to_string(event.type), e.what());
    }
  }
}

} // namespace server
} // namespace mcphub
