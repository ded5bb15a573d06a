#include "arb/concurrent/event_loop_thread.hpp"

#include <chrono>

namespace arb {

namespace {

// Upper bound on how long stop() waits for an idle worker to notice.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
  while (queue_.try_pop()) {
  }
}

void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdleWaitTimeout);
    if (!event) {
      continue;
    }
    bus_.publish(*event);
    dispatched_.fetch_add(1);
  }
}

}  // namespace arb
