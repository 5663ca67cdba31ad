// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for zkr::EventBus.
//
// Validates:
//   - Generic subscription receives every event type
//   - Typed subscription receives only its event type
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - Callbacks run in subscription order; empty callbacks are rejected
//   - Re-entrant publish from inside a callback does not deadlock
//   - Event payloads survive the variant dispatch
//
// All tests are single-threaded; cross-thread delivery is exercised by
// receipt_engine_test.cpp (events published from WorkerPool threads).
// =============================================================================

#include "zkr/eventbus/event_bus.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  zkr::EventBus bus;

  static zkr::ReceiptSubmittedEvent makeSubmitted(const std::string& id) {
    zkr::ReceiptSubmittedEvent e;
    e.receipt_id = id;
    e.venue = zkr::domain::Venue::Solana;
    e.claim_type = zkr::domain::ClaimType::TradeExecuted;
    e.timestamp_ms = 1000;
    return e;
  }

  static zkr::ReceiptFinalizedEvent makeFinalized(const std::string& id) {
    zkr::ReceiptFinalizedEvent e;
    e.receipt.receipt_id = id;
    e.receipt.status = zkr::domain::ReceiptStatus::Proved;
    e.timestamp_ms = 2000;
    return e;
  }
};

TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const zkr::Event&) { ++call_count; });

  bus.publish(makeSubmitted("a"));
  bus.publish(makeFinalized("a"));

  EXPECT_EQ(call_count, 2);
}

// -----------------------------------------------------------------------------
// Typed subscribers only fire for their own alternative.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersByType) {
  std::vector<std::string> finalized;
  bus.subscribe<zkr::ReceiptFinalizedEvent>(
      [&finalized](const zkr::ReceiptFinalizedEvent& e) {
        finalized.push_back(e.receipt.receipt_id);
      });

  bus.publish(makeSubmitted("ignored"));
  bus.publish(makeFinalized("r-1"));
  bus.publish(makeFinalized("r-2"));

  ASSERT_EQ(finalized.size(), 2u);
  EXPECT_EQ(finalized[0], "r-1");
  EXPECT_EQ(finalized[1], "r-2");
}

TEST_F(EventBusTest, PayloadSurvivesDispatch) {
  zkr::ReceiptSubmittedEvent seen;
  bus.subscribe<zkr::ReceiptSubmittedEvent>(
      [&seen](const zkr::ReceiptSubmittedEvent& e) { seen = e; });

  bus.publish(makeSubmitted("payload"));

  EXPECT_EQ(seen.receipt_id, "payload");
  EXPECT_EQ(seen.venue, zkr::domain::Venue::Solana);
  EXPECT_EQ(seen.claim_type, zkr::domain::ClaimType::TradeExecuted);
  EXPECT_EQ(seen.timestamp_ms, 1000);
}

TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int first = 0;
  int second = 0;
  bus.subscribe([&first](const zkr::Event&) { ++first; });
  bus.subscribe<zkr::ReceiptSubmittedEvent>(
      [&second](const zkr::ReceiptSubmittedEvent&) { ++second; });

  bus.publish(makeSubmitted("x"));

  EXPECT_EQ(first, 1);
  EXPECT_EQ(second, 1);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int count = 0;
  auto id = bus.subscribe([&count](const zkr::Event&) { ++count; });

  bus.publish(makeSubmitted("1"));
  bus.unsubscribe(id);
  bus.publish(makeSubmitted("2"));

  EXPECT_EQ(count, 1);
}

TEST_F(EventBusTest, CallbacksRunInSubscriptionOrder) {
  std::vector<int> order;
  bus.subscribe([&order](const zkr::Event&) { order.push_back(1); });
  bus.subscribe<zkr::ReceiptSubmittedEvent>(
      [&order](const zkr::ReceiptSubmittedEvent&) { order.push_back(2); });
  bus.subscribe([&order](const zkr::Event&) { order.push_back(3); });

  bus.publish(makeSubmitted("ordered"));

  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(bus.subscriberCount(), 3u);
}

TEST_F(EventBusTest, EmptyCallbackIsRejected) {
  EXPECT_THROW(bus.subscribe(zkr::EventBus::GenericCallback{}),
               std::invalid_argument);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// A callback that unsubscribes itself still finishes the current delivery.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SelfUnsubscribeDuringPublish) {
  int count = 0;
  zkr::EventBus::SubscriptionId id = 0;
  id = bus.subscribe([this, &count, &id](const zkr::Event&) {
    ++count;
    bus.unsubscribe(id);
  });

  bus.publish(makeSubmitted("1"));
  bus.publish(makeSubmitted("2"));

  EXPECT_EQ(count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, UnsubscribeUnknownIdIsNoOp) {
  int count = 0;
  bus.subscribe([&count](const zkr::Event&) { ++count; });

  bus.unsubscribe(12345);
  bus.publish(makeSubmitted("1"));

  EXPECT_EQ(count, 1);
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_THROW(bus.publish(makeFinalized("nobody")));
}

// -----------------------------------------------------------------------------
// A callback that publishes must not deadlock on the subscriber mutex.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ReentrantPublishDoesNotDeadlock) {
  int finalized = 0;
  bus.subscribe<zkr::ReceiptSubmittedEvent>(
      [this](const zkr::ReceiptSubmittedEvent& e) {
        bus.publish(makeFinalized(e.receipt_id));
      });
  bus.subscribe<zkr::ReceiptFinalizedEvent>(
      [&finalized](const zkr::ReceiptFinalizedEvent&) { ++finalized; });

  bus.publish(makeSubmitted("chain"));

  EXPECT_EQ(finalized, 1);
}
