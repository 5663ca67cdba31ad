#include "zkr/engine/command_dispatcher.hpp"

#include "zkr/domain/receipt_json.hpp"

#include <cstdint>
#include <iostream>

namespace zkr {

namespace {

nlohmann::json errorReply(const std::string& message) {
  return {{"status", "error"}, {"error", message}};
}

const std::string& requireString(const nlohmann::json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end() || !it->is_string()) {
    throw std::invalid_argument(std::string(key) + " is required");
  }
  return it->get_ref<const std::string&>();
}

std::chrono::milliseconds timeoutParam(const nlohmann::json& params,
                                       const char* key,
                                       std::chrono::milliseconds fallback) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_unsigned()) {
    throw std::invalid_argument(std::string(key) +
                                " must be a non-negative integer");
  }
  return std::chrono::milliseconds(it->get<std::uint64_t>());
}

}  // namespace

CommandDispatcher::CommandDispatcher(ReceiptEngine& engine) : engine_(engine) {}

std::string CommandDispatcher::execute(const std::string& message) {
  nlohmann::json request;
  try {
    request = nlohmann::json::parse(message);
  } catch (const nlohmann::json::parse_error& e) {
    return errorReply(std::string("invalid JSON request: ") + e.what()).dump();
  }
  return handle(request).dump();
}

// -----------------------------------------------------------------------------
// handle(request)
// -----------------------------------------------------------------------------
nlohmann::json CommandDispatcher::handle(const nlohmann::json& request) {
  if (!request.is_object() || !request.contains("command") ||
      !request["command"].is_string()) {
    return errorReply("request must be an object with a string \"command\"");
  }

  const std::string command = request["command"].get<std::string>();
  nlohmann::json params = nlohmann::json::object();
  if (auto it = request.find("params"); it != request.end() && !it->is_null()) {
    if (!it->is_object()) {
      return errorReply("params must be an object");
    }
    params = *it;
  }

  try {
    if (command == "PING") {
      return {{"status", "ok"}, {"response", "PONG"}};
    }
    if (command == "SUBMIT") {
      return submit(params);
    }
    if (command == "GET") {
      return get(params);
    }
    if (command == "WAIT") {
      return wait(params);
    }
    return errorReply("Unknown command: " + command);
  } catch (const std::exception& e) {
    std::cerr << "[CommandDispatcher] " << command << " failed: " << e.what()
              << "\n";
    return errorReply(e.what());
  }
}

nlohmann::json CommandDispatcher::submit(const nlohmann::json& params) {
  const auto request = params.get<domain::ProofRequest>();

  bool wait_for_result = true;
  if (auto it = params.find("wait_for_result"); it != params.end() && !it->is_null()) {
    if (!it->is_boolean()) {
      throw std::invalid_argument("wait_for_result must be a boolean");
    }
    wait_for_result = it->get<bool>();
  }
  const auto timeout =
      timeoutParam(params, "wait_timeout_ms", kDefaultWaitTimeout);

  const domain::ReceiptId receipt_id = engine_.submit(request);

  domain::ZKReceipt receipt;
  if (wait_for_result) {
    receipt = engine_.wait_for_receipt(receipt_id, timeout);
  } else {
    auto snapshot = engine_.get_receipt(receipt_id);
    if (!snapshot) {
      throw UnknownReceiptError(receipt_id);
    }
    receipt = std::move(*snapshot);
  }

  return {{"status", "ok"}, {"receipt_id", receipt_id}, {"receipt", receipt}};
}

nlohmann::json CommandDispatcher::get(const nlohmann::json& params) {
  const std::string& receipt_id = requireString(params, "receipt_id");

  auto receipt = engine_.get_receipt(receipt_id);
  if (!receipt) {
    throw UnknownReceiptError(receipt_id);
  }
  return {{"status", "ok"}, {"receipt", *receipt}};
}

nlohmann::json CommandDispatcher::wait(const nlohmann::json& params) {
  const std::string& receipt_id = requireString(params, "receipt_id");
  const auto timeout = timeoutParam(params, "timeout_ms", kDefaultWaitTimeout);

  return {{"status", "ok"},
          {"receipt", engine_.wait_for_receipt(receipt_id, timeout)}};
}

}  // namespace zkr
