#pragma once

#include "arb/concurrent/thread_safe_queue.hpp"
#include "arb/eventbus/event_bus.hpp"
#include "arb/events/event.hpp"

#include <atomic>
#include <cstdint>
#include <thread>

namespace arb {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its EventBus. Every subscriber therefore runs
// on the loop thread, which is what serializes reserve book updates, route
// evaluation and paper execution in the engine (the "scan loop").
//
// Lifecycle: construct, subscribe via eventBus(), start(), push(), stop().
// stop() lets the event currently being dispatched finish; events still
// queued are discarded. The destructor calls stop().
//
// Thread model: start(), stop() and push() may be called from any thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  /// Idempotent while running.
  void start();

  /// Idempotent; start() may be called again afterwards.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool isRunning() const { return running_.load(); }

  /// Number of events published by the worker since construction.
  std::uint64_t dispatchedCount() const { return dispatched_.load(); }

 private:
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dispatched_{0};
  std::thread thread_;
};

}  // namespace arb
