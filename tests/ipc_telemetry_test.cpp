// =============================================================================
// ipc_telemetry_test.cpp
// =============================================================================
// Tests for arb::IpcServer.
//
// Validates:
//   - formatTelemetry() JSON for each published event type
//   - ReserveUpdateEvents are not published
//   - Command round trip over the REP socket
//   - Telemetry delivery over the PUB socket
//
// The socket tests bind ipc:// endpoints under the temp directory so they
// do not compete for TCP ports.
// =============================================================================

#include "arb/network/ipc_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <filesystem>
#include <string>

using nlohmann::json;

namespace {

// 2024-01-01 12:00:00 UTC
constexpr std::int64_t kNoon = 1704110400000;

json format(const arb::Event& event) {
  const auto text = arb::IpcServer::formatTelemetry(event);
  EXPECT_TRUE(text.has_value());
  return text ? json::parse(*text) : json();
}

std::string endpoint(const std::string& name) {
  return "ipc://" +
         (std::filesystem::temp_directory_path() / ("arb_ipc_test_" + name))
             .string();
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. formatTelemetry
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, RiskEventNotice) {
  arb::RiskEventNotice notice;
  notice.event.type = "kill_switch";
  notice.event.description = "Emergency stop activated";
  notice.event.state.is_killed = true;
  notice.event.state.kill_reason = "Emergency stop activated";
  notice.event.timestamp_ms = kNoon;

  const json j = format(notice);
  EXPECT_EQ(j.at("type"), "risk_event");
  EXPECT_EQ(j.at("event"), "kill_switch");
  EXPECT_EQ(j.at("description"), "Emergency stop activated");
  EXPECT_EQ(j.at("state").at("is_killed"), true);
  EXPECT_EQ(j.at("state").at("kill_reason"), "Emergency stop activated");
  EXPECT_EQ(j.at("timestamp_ms"), kNoon);
}

// -----------------------------------------------------------------------------
// Why: Native amounts exceed 64 bits, so they travel as decimal strings.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, TradeCandidateAmountsAreStrings) {
  arb::TradeCandidateEvent event;
  event.candidate.route = {"USDC-WETH-DAI",
                           {"USDC", "WETH", "DAI"},
                           {"quickswap", "sushiswap", "quickswap"}};
  event.candidate.notional_usd = 250.0;
  event.candidate.amount_in = arb::domain::pow10(30);
  event.candidate.leg_amounts_out = {1, 2, arb::domain::pow10(20)};
  event.candidate.net_profit_native = -42;
  event.candidate.net_profit_usd = 3.25;
  event.candidate.score = 0.81;
  event.timestamp_ms = kNoon;

  const json j = format(event);
  EXPECT_EQ(j.at("type"), "trade_candidate");
  EXPECT_EQ(j.at("timestamp_ms"), kNoon);
  const json& c = j.at("candidate");
  EXPECT_EQ(c.at("route"), "USDC-WETH-DAI");
  EXPECT_EQ(c.at("venues").size(), 3u);
  EXPECT_EQ(c.at("amount_in"), "1000000000000000000000000000000");
  EXPECT_EQ(c.at("leg_amounts_out").at(2), "100000000000000000000");
  EXPECT_EQ(c.at("net_profit_native"), "-42");
  EXPECT_DOUBLE_EQ(c.at("net_profit_usd").get<double>(), 3.25);
  EXPECT_DOUBLE_EQ(c.at("score").get<double>(), 0.81);
}

TEST(IpcTelemetryTest, TradeExecuted) {
  arb::TradeExecutedEvent event;
  event.record.id = "paper-1";
  event.record.route = "USDC-WETH-DAI";
  event.record.status = arb::domain::TradeStatus::Success;
  event.record.tx_ref = "paper-1";

  const json j = format(event);
  EXPECT_EQ(j.at("type"), "trade_executed");
  EXPECT_EQ(j.at("trade").at("id"), "paper-1");
  EXPECT_EQ(j.at("trade").at("status"), "success");
  EXPECT_EQ(j.at("trade").at("tx_ref"), "paper-1");
}

TEST(IpcTelemetryTest, Heartbeat) {
  const json j = format(arb::HeartbeatEvent{kNoon, 7});
  EXPECT_EQ(j.at("type"), "heartbeat");
  EXPECT_EQ(j.at("timestamp_ms"), kNoon);
}

TEST(IpcTelemetryTest, ReserveUpdatesAreNotPublished) {
  arb::ReserveUpdateEvent update;
  update.venue = "quickswap";
  EXPECT_FALSE(arb::IpcServer::formatTelemetry(update).has_value());
}

// -----------------------------------------------------------------------------
// 2. Sockets
// -----------------------------------------------------------------------------
TEST(IpcServerTest, CommandRoundTrip) {
  const std::string cmd = endpoint("cmd_rt");
  const std::string pub = endpoint("pub_rt");
  arb::IpcServer server([](const std::string& c) { return "ack:" + c; }, cmd,
                        pub);
  server.start();

  zmq::context_t ctx(1);
  zmq::socket_t req(ctx, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  req.connect(cmd);

  req.send(zmq::buffer(std::string("PING")), zmq::send_flags::none);
  zmq::message_t reply;
  ASSERT_TRUE(req.recv(reply, zmq::recv_flags::none).has_value());
  EXPECT_EQ(reply.to_string(), "ack:PING");

  req.close();
  server.stop();
}

// -----------------------------------------------------------------------------
// Why: PUB/SUB drops messages until the subscription propagates, so the
//      heartbeat is re-sent until one arrives.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, TelemetryReachesSubscriber) {
  const std::string cmd = endpoint("cmd_pub");
  const std::string pub = endpoint("pub_pub");
  arb::IpcServer server([](const std::string&) { return std::string(); },
                        cmd, pub);
  server.start();

  zmq::context_t ctx(1);
  zmq::socket_t sub(ctx, zmq::socket_type::sub);
  sub.set(zmq::sockopt::subscribe, "");
  sub.set(zmq::sockopt::rcvtimeo, 100);
  sub.set(zmq::sockopt::linger, 0);
  sub.connect(pub);

  std::string received;
  for (int attempt = 0; attempt < 50 && received.empty(); ++attempt) {
    server.pushTelemetry(arb::ReserveUpdateEvent{});
    server.pushTelemetry(arb::HeartbeatEvent{kNoon, 1});
    zmq::message_t msg;
    if (sub.recv(msg, zmq::recv_flags::none)) {
      received = msg.to_string();
    }
  }

  sub.close();
  server.stop();

  ASSERT_FALSE(received.empty());
  EXPECT_EQ(json::parse(received).at("type"), "heartbeat");
}
