#include "zkr/eventbus/event_bus.hpp"

#include <stdexcept>
#include <vector>

namespace zkr {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  if (!callback) {
    throw std::invalid_argument("EventBus::subscribe requires a callback");
  }
  auto shared = std::make_shared<const GenericCallback>(std::move(callback));

  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace(id, std::move(shared));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(id);
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<CallbackPtr> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot.reserve(subscribers_.size());
    for (const auto& entry : subscribers_) {
      snapshot.push_back(entry.second);
    }
  }

  for (const auto& callback : snapshot) {
    (*callback)(event);
  }
}

}  // namespace zkr
