#include "arb/network/ipc_server.hpp"
#include "arb/persistence/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace arb {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  // Final drain so events queued during shutdown still go out.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (!json_str) {
      continue;
    }
    zmq::message_t msg(json_str->data(), json_str->size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] telemetry dropped (PUB would block)\n";
    }
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  nlohmann::json j;
  if (const auto* e = std::get_if<RiskEventNotice>(&event)) {
    j["type"] = "risk_event";
    j["event"] = e->event.type;
    j["description"] = e->event.description;
    j["state"] = e->event.state;
    j["timestamp_ms"] = e->event.timestamp_ms;
  } else if (const auto* e = std::get_if<TradeCandidateEvent>(&event)) {
    j["type"] = "trade_candidate";
    j["candidate"] = e->candidate;
    j["timestamp_ms"] = e->timestamp_ms;
  } else if (const auto* e = std::get_if<TradeExecutedEvent>(&event)) {
    j["type"] = "trade_executed";
    j["trade"] = e->record;
  } else if (const auto* e = std::get_if<HeartbeatEvent>(&event)) {
    j["type"] = "heartbeat";
    j["timestamp_ms"] = e->timestamp_ms;
  } else {
    return std::nullopt;
  }
  return j.dump();
}

}  // namespace arb
