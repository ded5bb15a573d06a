#pragma once

#include "arb/events/event.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace arb {

/// Parses one feed message:
///   {"timestamp_ms": int, "venue": str, "token0": str, "token1": str,
///    "reserve0": "decimal", "reserve1": "decimal", "fee_bps": int?}
/// Reserves are decimal strings because they exceed 64 bits. Throws
/// nlohmann::json::exception or std::invalid_argument / std::out_of_range
/// on malformed input.
ReserveUpdateEvent parseReserveUpdate(const std::string& payload);

// -----------------------------------------------------------------------------
// ReserveFeedGateway
// -----------------------------------------------------------------------------
//
// @brief  ZeroMQ SUB client that turns reserve feed messages into
//         ReserveUpdateEvents and hands them to a sink.
//
// @details
// run() blocks in a recv loop with a kRecvTimeoutMs timeout so stop() is
// observed promptly. Malformed messages are logged and skipped; the loop
// never exits because of bad input.
//
// When constructed with a SimulationTimeProvider, each message moves the
// simulated clock forward (never back) to its timestamp_ms before the event
// is handed to the sink, so the RiskController sees feed time.
//
// Thread model: run() executes on the ReserveFeedThread; stop() may be
// called from any thread.
// -----------------------------------------------------------------------------
class ReserveFeedGateway {
 public:
  using EventSink = std::function<void(Event)>;

  ReserveFeedGateway(EventSink event_sink, const std::string& endpoint,
                     SimulationTimeProvider* sim_clock = nullptr);

  ReserveFeedGateway(const ReserveFeedGateway&) = delete;
  ReserveFeedGateway& operator=(const ReserveFeedGateway&) = delete;
  ReserveFeedGateway(ReserveFeedGateway&&) = delete;
  ReserveFeedGateway& operator=(ReserveFeedGateway&&) = delete;

  void run();
  void stop();

  /// Parses one payload and forwards it; false (logged) if malformed.
  bool handlePayload(const std::string& payload);

  std::uint64_t receivedCount() const { return sequence_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;
  SimulationTimeProvider* sim_clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace arb
