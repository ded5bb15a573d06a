#include "arb/gateway/reserve_feed_gateway.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace arb {

ReserveUpdateEvent parseReserveUpdate(const std::string& payload) {
  const auto json = nlohmann::json::parse(payload);

  ReserveUpdateEvent update;
  update.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
  update.venue = json.at("venue").get<std::string>();
  update.token0 = json.at("token0").get<std::string>();
  update.token1 = json.at("token1").get<std::string>();
  update.reserve0 =
      domain::parseAmount(json.at("reserve0").get<std::string>());
  update.reserve1 =
      domain::parseAmount(json.at("reserve1").get<std::string>());
  if (auto it = json.find("fee_bps"); it != json.end() && !it->is_null()) {
    update.fee_bps = it->get<std::uint32_t>();
  }
  return update;
}

ReserveFeedGateway::ReserveFeedGateway(EventSink event_sink,
                                       const std::string& endpoint,
                                       SimulationTimeProvider* sim_clock)
    : event_sink_(std::move(event_sink)), sim_clock_(sim_clock) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

bool ReserveFeedGateway::handlePayload(const std::string& payload) {
  ReserveUpdateEvent update;
  try {
    update = parseReserveUpdate(payload);
  } catch (const std::exception& e) {
    std::cerr << "[ReserveFeedGateway] dropping malformed message: "
              << e.what() << " payload: " << payload << "\n";
    return false;
  }

  if (sim_clock_ != nullptr && update.timestamp_ms > sim_clock_->now_ms()) {
    sim_clock_->advance_time(update.timestamp_ms);
  }
  update.sequence_id = sequence_.fetch_add(1) + 1;
  event_sink_(std::move(update));
  return true;
}

void ReserveFeedGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // timeout
    }
    handlePayload(msg.to_string());
  }
}

void ReserveFeedGateway::stop() { running_.store(false); }

}  // namespace arb
