#include "arb/network/reserve_feed_thread.hpp"

#include <iostream>
#include <utility>

namespace arb {

ReserveFeedThread::ReserveFeedThread(EventSink event_sink,
                                     std::string endpoint,
                                     SimulationTimeProvider* sim_clock)
    : event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)),
      sim_clock_(sim_clock) {}

ReserveFeedThread::~ReserveFeedThread() { stop(); }

void ReserveFeedThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ =
      std::make_unique<ReserveFeedGateway>(event_sink_, endpoint_, sim_clock_);

  thread_ = std::thread([this] {
    std::cout << "[ReserveFeedThread] subscribed to " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[ReserveFeedThread] recv loop exited after "
              << gateway_->receivedCount() << " updates.\n";
  });
}

void ReserveFeedThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace arb
