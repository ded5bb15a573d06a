#pragma once

#include "arb/concurrent/thread_safe_queue.hpp"
#include "arb/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace arb {

// -----------------------------------------------------------------------------
// IpcServer
// -----------------------------------------------------------------------------
//
// @brief  Operator channel: a ZeroMQ REP socket for commands and a PUB
//         socket for JSON telemetry.
//
// @details
// One background thread alternates between draining the telemetry queue
// onto the PUB socket and waiting up to kPollTimeoutMs for a command on the
// REP socket. Each command string is passed to the CommandHandler
// (ArbitrageEngine::executeCommand) and its return value is sent back as
// the reply.
//
// Telemetry messages (one JSON object per message, tagged by "type"):
//   risk_event       {type, event, description, state, timestamp_ms}
//   trade_candidate  {type, candidate{...}, timestamp_ms}
//   trade_executed   {type, trade{...}}
//   heartbeat        {type, timestamp_ms}
// ReserveUpdateEvents are not published.
//
// Thread model: pushTelemetry() may be called from any thread. The
// CommandHandler runs on the IPC thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  /// Binds both sockets and starts the thread. Throws zmq::error_t when an
  /// endpoint cannot be bound.
  void start();

  /// Flushes pending telemetry, joins the thread and closes the sockets.
  void stop();

  void pushTelemetry(Event event);

  /// JSON text for `event`, or std::nullopt for event types that are not
  /// published.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace arb
