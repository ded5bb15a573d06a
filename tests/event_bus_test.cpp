// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for arb::EventBus.
//
// Validates:
//   - Generic subscription sees every event alternative
//   - Typed subscription filters on the variant alternative
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A throwing subscriber does not starve the ones after it
//   - Re-entrant publish from inside a callback does not deadlock
//   - Payload fields survive dispatch
//
// All tests are single-threaded. Cross-thread delivery through the scan loop
// is covered in event_loop_thread_test.cpp.
// =============================================================================

#include "arb/eventbus/event_bus.hpp"
#include "arb/events/event.hpp"
#include "arb/events/event_types.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  arb::EventBus bus;

  static arb::ReserveUpdateEvent makeUpdate(const std::string& venue,
                                            std::uint64_t seq) {
    arb::ReserveUpdateEvent e;
    e.venue = venue;
    e.token0 = "USDC";
    e.token1 = "WETH";
    e.reserve0 = 1000000;
    e.reserve1 = 500;
    e.sequence_id = seq;
    return e;
  }

  static arb::HeartbeatEvent makeHeartbeat(std::int64_t ts) {
    return arb::HeartbeatEvent{ts, 0};
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event type.
// Why: The telemetry publisher subscribes generically and filters itself.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const arb::Event&) { ++call_count; });

  bus.publish(makeUpdate("quickswap", 1));
  bus.publish(makeHeartbeat(1000));
  bus.publish(arb::RiskEventNotice{});
  bus.publish(arb::TradeExecutedEvent{});

  EXPECT_EQ(call_count, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered alternative.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int update_count = 0;
  bus.subscribe<arb::ReserveUpdateEvent>(
      [&update_count](const arb::ReserveUpdateEvent&) { ++update_count; });

  bus.publish(makeUpdate("quickswap", 1));
  bus.publish(makeHeartbeat(1000));

  EXPECT_EQ(update_count, 1);
}

TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;

  bus.subscribe<arb::HeartbeatEvent>(
      [&count_a](const arb::HeartbeatEvent&) { ++count_a; });
  bus.subscribe<arb::HeartbeatEvent>(
      [&count_b](const arb::HeartbeatEvent&) { ++count_b; });

  bus.publish(makeHeartbeat(1));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

// -----------------------------------------------------------------------------
// 3. After unsubscribe(id) the callback no longer fires.
// Why: The engine unsubscribes the telemetry publisher before destroying the
//      IpcServer it points to.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<arb::HeartbeatEvent>(
      [&call_count](const arb::HeartbeatEvent&) { ++call_count; });

  bus.publish(makeHeartbeat(1));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  bus.publish(makeHeartbeat(2));

  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, UnsubscribeNonExistentIdIsNoOp) {
  EXPECT_NO_THROW(bus.unsubscribe(9999));
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_NO_THROW(bus.publish(makeUpdate("sushiswap", 1)));
}

// -----------------------------------------------------------------------------
// 4. A subscriber that throws is logged and skipped; later subscribers still
//    receive the event and publish() does not propagate the exception.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingSubscriberDoesNotStopDelivery) {
  int after = 0;
  bus.subscribe([](const arb::Event&) {
    throw std::runtime_error("subscriber failure");
  });
  bus.subscribe([&after](const arb::Event&) { ++after; });

  EXPECT_NO_THROW(bus.publish(makeHeartbeat(1)));
  EXPECT_EQ(after, 1);
}

// -----------------------------------------------------------------------------
// 5. Publishing from inside a callback must not deadlock.
// Why: The executor sink publishes TradeCandidateEvent and TradeExecutedEvent
//      while the bus is dispatching the ReserveUpdateEvent that caused them.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int executed = 0;

  bus.subscribe<arb::TradeExecutedEvent>(
      [&executed](const arb::TradeExecutedEvent&) { ++executed; });

  bus.subscribe<arb::ReserveUpdateEvent>(
      [this](const arb::ReserveUpdateEvent& update) {
        arb::TradeExecutedEvent e;
        e.record.route = update.venue;
        e.sequence_id = update.sequence_id;
        bus.publish(e);
      });

  bus.publish(makeUpdate("quickswap", 7));

  EXPECT_EQ(executed, 1);
}

TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::string venue;
  arb::domain::Amount reserve0 = 0;
  std::uint64_t seq = 0;

  bus.subscribe<arb::ReserveUpdateEvent>(
      [&](const arb::ReserveUpdateEvent& e) {
        venue = e.venue;
        reserve0 = e.reserve0;
        seq = e.sequence_id;
      });

  bus.publish(makeUpdate("sushiswap", 42));

  EXPECT_EQ(venue, "sushiswap");
  EXPECT_TRUE(reserve0 == 1000000);
  EXPECT_EQ(seq, 42u);
}
