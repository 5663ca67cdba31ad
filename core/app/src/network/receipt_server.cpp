#include "zkr/network/receipt_server.hpp"

#include "zkr/domain/receipt_status.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace zkr {

ReceiptServer::ReceiptServer(CommandHandler command_handler,
                             std::string cmd_endpoint,
                             std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

ReceiptServer::~ReceiptServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn the server thread
// -----------------------------------------------------------------------------
void ReceiptServer::start() {
  if (running_.load()) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();  // loop exited on a socket error
  }
  // Sockets must close before their context is replaced.
  cmd_socket_.reset();
  pub_socket_.reset();

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

  std::cout << "[ReceiptServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void ReceiptServer::stop() {
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

  std::cout << "[ReceiptServer] stopped.\n";
}

void ReceiptServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): server thread. A socket error ends the loop; it never escapes.
// -----------------------------------------------------------------------------
void ReceiptServer::run() {
  try {
    while (running_.load()) {
      processTelemetry();
      processCommands();
    }

    // Publish whatever finished while we were shutting down.
    processTelemetry();
  } catch (const zmq::error_t& e) {
    std::cerr << "[ReceiptServer] socket error, server loop exiting: "
              << e.what() << "\n";
    running_.store(false);
  }
}

void ReceiptServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
        std::cerr << "[ReceiptServer] telemetry dropped (PUB would block).\n";
      }
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void ReceiptServer::processCommands() {
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

  // REP must answer every request before it can receive the next one.
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[ReceiptServer] command handler failed: " << e.what()
              << "\n";
    response = nlohmann::json{{"status", "error"}, {"error", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry()
// -----------------------------------------------------------------------------
std::optional<std::string> ReceiptServer::formatTelemetry(const Event& event) {
  const auto* e = std::get_if<ReceiptFinalizedEvent>(&event);
  if (e == nullptr) {
    return std::nullopt;
  }

  nlohmann::json j;
  j["type"] = "receipt_finalized";
  j["receipt_id"] = e->receipt.receipt_id;
  j["status"] = domain::receiptStatusToString(e->receipt.status);
  if (e->receipt.non_provable) {
    j["reason_code"] =
        domain::nonProvableReasonToString(e->receipt.non_provable->reason_code);
  } else {
    j["reason_code"] = nullptr;
  }
  j["timestamp_ms"] = e->timestamp_ms;
  return j.dump();
}

}  // namespace zkr
