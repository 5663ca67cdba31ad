// =============================================================================
// command_dispatcher_test.cpp
// =============================================================================
// Unit tests for zkr::CommandDispatcher: the JSON request/reply protocol
// served on the REP socket.
//
// Validates:
//   - PING / SUBMIT / GET / WAIT replies
//   - Error replies for malformed JSON, bad envelopes, bad parameters,
//     unknown commands and unknown receipt ids
// =============================================================================

#include "zkr/adapter/synthetic_venue_adapter.hpp"
#include "zkr/engine/command_dispatcher.hpp"
#include "zkr/prover/sp1_mvp_prover.hpp"
#include "zkr/time/simulation_time_provider.hpp"
#include "zkr/verifier/offchain_verifier.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using nlohmann::json;

class CommandDispatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    zkr::ReceiptEngine::AdapterList adapters;
    for (auto venue : zkr::domain::kAllVenues) {
      adapters.push_back(
          std::make_shared<zkr::adapter::SyntheticVenueAdapter>(venue, clock));
    }
    engine = std::make_unique<zkr::ReceiptEngine>(
        adapters, zkr::policy::PolicyEngine::withDefaults(),
        std::make_shared<zkr::prover::Sp1MvpProver>(),
        std::make_shared<zkr::verifier::OffchainVerifier>(), clock);
    engine->start();
    dispatcher = std::make_unique<zkr::CommandDispatcher>(*engine);
  }

  void TearDown() override { engine->stop(); }

  json call(const json& request) {
    return json::parse(dispatcher->execute(request.dump()));
  }

  static json submitParams() {
    return {{"venue", "hyperliquid"},
            {"claim_type", "ORDER_PLACED"},
            {"account_ref", "acct-1"},
            {"order_ref", "ord-1"}};
  }

  zkr::SimulationTimeProvider clock{1700000000000};
  std::unique_ptr<zkr::ReceiptEngine> engine;
  std::unique_ptr<zkr::CommandDispatcher> dispatcher;
};

TEST_F(CommandDispatcherTest, Ping) {
  auto reply = call({{"command", "PING"}});
  EXPECT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["response"], "PONG");
}

// -----------------------------------------------------------------------------
// SUBMIT waits for the terminal receipt by default.
// -----------------------------------------------------------------------------
TEST_F(CommandDispatcherTest, SubmitWaitsForResult) {
  auto reply = call({{"command", "SUBMIT"}, {"params", submitParams()}});

  ASSERT_EQ(reply["status"], "ok");
  const auto& receipt = reply["receipt"];
  EXPECT_EQ(receipt["receipt_id"], reply["receipt_id"]);
  EXPECT_EQ(receipt["status"], "PROVED");
  EXPECT_EQ(receipt["subject"]["venue"], "hyperliquid");
  EXPECT_EQ(receipt["proof"]["backend"], "SP1");
}

TEST_F(CommandDispatcherTest, SubmitReportsNonProvable) {
  auto params = submitParams();
  params["payload"] = {{"simulate_conflict", true}};

  auto reply = call({{"command", "SUBMIT"}, {"params", params}});

  ASSERT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["receipt"]["status"], "NON_PROVABLE");
  EXPECT_EQ(reply["receipt"]["non_provable"]["reason_code"], "EVIDENCE_CONFLICT");
}

TEST_F(CommandDispatcherTest, SubmitWithoutWaitThenWait) {
  auto params = submitParams();
  params["wait_for_result"] = false;

  auto submitted = call({{"command", "SUBMIT"}, {"params", params}});
  ASSERT_EQ(submitted["status"], "ok");
  const std::string id = submitted["receipt_id"].get<std::string>();
  EXPECT_EQ(submitted["receipt"]["receipt_id"], id);

  auto waited = call({{"command", "WAIT"},
                      {"params", {{"receipt_id", id}, {"timeout_ms", 5000}}}});
  ASSERT_EQ(waited["status"], "ok");
  EXPECT_EQ(waited["receipt"]["status"], "PROVED");

  auto fetched = call({{"command", "GET"}, {"params", {{"receipt_id", id}}}});
  ASSERT_EQ(fetched["status"], "ok");
  EXPECT_EQ(fetched["receipt"], waited["receipt"]);
}

// -----------------------------------------------------------------------------
// Error replies
// -----------------------------------------------------------------------------
TEST_F(CommandDispatcherTest, MalformedJson) {
  auto reply = json::parse(dispatcher->execute("{not json"));
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["error"].get<std::string>().rfind("invalid JSON request: ", 0),
            0u);
}

TEST_F(CommandDispatcherTest, BadEnvelope) {
  EXPECT_EQ(call(json::array({1, 2}))["error"],
            "request must be an object with a string \"command\"");
  EXPECT_EQ(call({{"command", 7}})["error"],
            "request must be an object with a string \"command\"");
  EXPECT_EQ(call({{"command", "GET"}, {"params", "x"}})["error"],
            "params must be an object");
}

TEST_F(CommandDispatcherTest, UnknownCommand) {
  auto reply = call({{"command", "CANCEL"}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["error"], "Unknown command: CANCEL");
}

TEST_F(CommandDispatcherTest, SubmitRejectsBadRequest) {
  auto bad_venue = submitParams();
  bad_venue["venue"] = "binance";
  auto reply = call({{"command", "SUBMIT"}, {"params", bad_venue}});
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["error"], "invalid venue: binance");

  auto missing_order = submitParams();
  missing_order.erase("order_ref");
  EXPECT_EQ(call({{"command", "SUBMIT"}, {"params", missing_order}})["status"],
            "error");

  auto bad_flag = submitParams();
  bad_flag["wait_for_result"] = "yes";
  EXPECT_EQ(call({{"command", "SUBMIT"}, {"params", bad_flag}})["error"],
            "wait_for_result must be a boolean");

  auto bad_timeout = submitParams();
  bad_timeout["wait_timeout_ms"] = -5;
  EXPECT_EQ(call({{"command", "SUBMIT"}, {"params", bad_timeout}})["error"],
            "wait_timeout_ms must be a non-negative integer");
}

TEST_F(CommandDispatcherTest, GetAndWaitNeedKnownId) {
  EXPECT_EQ(call({{"command", "GET"}})["error"], "receipt_id is required");
  EXPECT_EQ(call({{"command", "WAIT"}, {"params", {{"receipt_id", 3}}}})["error"],
            "receipt_id is required");

  EXPECT_EQ(call({{"command", "GET"}, {"params", {{"receipt_id", "nope"}}}})["error"],
            "unknown receipt id: nope");
  EXPECT_EQ(call({{"command", "WAIT"}, {"params", {{"receipt_id", "nope"}}}})["error"],
            "unknown receipt id: nope");
}
