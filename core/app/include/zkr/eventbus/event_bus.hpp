#pragma once

#include "zkr/events/event.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace zkr {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for receipt lifecycle events.
// ReceiptEngine publishes; observers (ReceiptServer telemetry, tests, the
// demo in main) subscribe without the engine knowing about them.
//
// Thread model: Thread-safe for concurrent subscribe, unsubscribe, and
// publish from any thread. Callbacks run synchronously on the thread that
// calls publish(): the submitting thread for ReceiptSubmittedEvent, a
// WorkerPool thread for ReceiptFinalizedEvent. Callbacks must therefore be
// short and must not block on the engine.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;

  // Opaque id returned by subscribe(); pass to unsubscribe() to remove.
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked for every published event.
  // Output: SubscriptionId to use with unsubscribe(). Ids increase, and
  //         callbacks run in subscription order.
  // Throws: std::invalid_argument for an empty callback.
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only when the published event holds
  // an EventType (e.g. ReceiptFinalizedEvent).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // What: Removes the subscription. A publish() already in progress may
  // still invoke the callback for its current event.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // What: Invokes every registered callback on the calling thread. The
  // callback pointers are snapshotted under the lock and run without it,
  // so a callback may itself publish or unsubscribe. An exception thrown by
  // a callback propagates to the publisher; later callbacks are skipped.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  // Callbacks are shared so a publish() in flight keeps its snapshot alive
  // after unsubscribe() without copying every std::function per event.
  using CallbackPtr = std::shared_ptr<const GenericCallback>;

  mutable std::mutex mutex_;  // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::map<SubscriptionId, CallbackPtr> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace zkr
