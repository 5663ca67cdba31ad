#pragma once

#include "zkr/engine/receipt_engine.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace zkr {

// -----------------------------------------------------------------------------
// CommandDispatcher: JSON command protocol in front of ReceiptEngine
// -----------------------------------------------------------------------------
//
// @brief  Turns one request message into one reply message.
//
// @details
// Request:  {"command": "<NAME>", "params": {...}}   (params optional)
// Reply:    {"status": "ok", ...}  or  {"status": "error", "error": "<msg>"}
//
// Commands:
//   PING    → {"status":"ok","response":"PONG"}
//   SUBMIT  params: venue, claim_type, account_ref, order_ref,
//                   execution_ref?, payload?, wait_for_result? (true),
//                   wait_timeout_ms? (3000)
//           → {"status":"ok","receipt_id":..., "receipt": {...}}
//             receipt is the terminal receipt when waited, else the
//             PENDING snapshot.
//   GET     params: receipt_id → {"status":"ok","receipt": {...}}
//   WAIT    params: receipt_id, timeout_ms? (3000)
//           → {"status":"ok","receipt": {...}}
//
// Every exception (malformed JSON, bad field, unknown id, timeout, pipeline
// fault) is turned into an error reply; execute() never throws.
//
// Thread model: Called on the ReceiptServer thread. Only uses the engine's
// thread-safe public API.
// -----------------------------------------------------------------------------
class CommandDispatcher {
 public:
  static constexpr std::chrono::milliseconds kDefaultWaitTimeout{3000};

  // @param engine  Must outlive the dispatcher.
  explicit CommandDispatcher(ReceiptEngine& engine);

  // Raw message in, serialised reply out.
  std::string execute(const std::string& message);

  // Parsed request in, reply object out. Never throws.
  nlohmann::json handle(const nlohmann::json& request);

 private:
  nlohmann::json submit(const nlohmann::json& params);
  nlohmann::json get(const nlohmann::json& params);
  nlohmann::json wait(const nlohmann::json& params);

  ReceiptEngine& engine_;
};

}  // namespace zkr
