#pragma once

#include "zkr/concurrent/thread_safe_queue.hpp"
#include "zkr/events/event.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace zkr {

// -----------------------------------------------------------------------------
// ReceiptServer: ZeroMQ command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers command requests (REP socket)
//         and broadcasts receipt lifecycle telemetry (PUB socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (port 5556 by default):
//      Each received message is passed to the command handler (bound to
//      CommandDispatcher::execute()) and its reply is sent back. ZMQ_RCVTIMEO
//      keeps recv() from blocking forever, so the thread alternates between
//      command polling and telemetry draining.
//
//   2. PUB socket (port 5557 by default):
//      One JSON message per ReceiptFinalizedEvent:
//        {"type":"receipt_finalized","receipt_id":...,"status":...,
//         "reason_code":<code or null>,"timestamp_ms":...}
//      Events reach the server through a ThreadSafeQueue filled from
//      WorkerPool threads (pushTelemetry()), so serialisation and socket
//      I/O never run on a pipeline thread.
//
// A SUBMIT with wait_for_result blocks this thread for up to its wait
// timeout; telemetry accumulates in the queue meanwhile.
//
// Thread model:
//   start()/stop() from the owning thread (main). pushTelemetry() from any
//   thread. The command handler runs on the server thread; exceptions it
//   lets escape are logged and answered with an error reply.
//
// Ownership:
//   Owns the ZMQ context, both sockets, the telemetry queue, and the thread.
// -----------------------------------------------------------------------------
class ReceiptServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Stores parameters; sockets are opened by start().
  // -------------------------------------------------------------------------
  explicit ReceiptServer(CommandHandler command_handler,
                         std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                         std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: calls stop().
  ~ReceiptServer();

  ReceiptServer(const ReceiptServer&) = delete;
  ReceiptServer& operator=(const ReceiptServer&) = delete;
  ReceiptServer(ReceiptServer&&) = delete;
  ReceiptServer& operator=(ReceiptServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds both sockets and spawns the server thread.
  //
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Signals the thread, joins it (within kPollTimeoutMs plus any
  //         in-flight command) and closes the sockets. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Enqueues an event for the PUB socket. Safe from any thread.
  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return The PUB message for a ReceiptFinalizedEvent; std::nullopt for
  //         event types that are not broadcast.
  // -------------------------------------------------------------------------
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

}  // namespace zkr
