#pragma once

#include "arb/events/event.hpp"
#include "arb/gateway/reserve_feed_gateway.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace arb {

// -----------------------------------------------------------------------------
// ReserveFeedThread
// -----------------------------------------------------------------------------
// Owns the thread that runs ReserveFeedGateway::run(). The gateway (and its
// ZeroMQ socket) is created in start() so the socket lives entirely on the
// feed thread's lifetime; stop() signals the gateway, joins, and destroys
// it. The sink is typically ArbitrageEngine::pushEvent, which enqueues onto
// the scan loop.
// -----------------------------------------------------------------------------
class ReserveFeedThread {
 public:
  using EventSink = std::function<void(Event)>;

  ReserveFeedThread(EventSink event_sink, std::string endpoint,
                    SimulationTimeProvider* sim_clock = nullptr);
  ~ReserveFeedThread();

  ReserveFeedThread(const ReserveFeedThread&) = delete;
  ReserveFeedThread& operator=(const ReserveFeedThread&) = delete;
  ReserveFeedThread(ReserveFeedThread&&) = delete;
  ReserveFeedThread& operator=(ReserveFeedThread&&) = delete;

  void start();
  void stop();

 private:
  EventSink event_sink_;
  std::string endpoint_;
  SimulationTimeProvider* sim_clock_;

  std::unique_ptr<ReserveFeedGateway> gateway_;
  std::thread thread_;
};

}  // namespace arb
