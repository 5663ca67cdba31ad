// =============================================================================
// synthetic_adapter_test.cpp
// =============================================================================
// Unit tests for zkr::adapter::SyntheticVenueAdapter and the default
// IVenueAdapter::buildStatement().
//
// Validates:
//   - Acknowledgement fields and hash binding
//   - Source kinds per venue and the TRADE_EXECUTED execution item
//   - Payload switches: conflict, missing tags, ack/evidence failure
//   - Reproducible output on a SimulationTimeProvider
// =============================================================================

#include "zkr/adapter/synthetic_venue_adapter.hpp"
#include "zkr/integrity/hashing.hpp"
#include "zkr/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>

using zkr::domain::ClaimType;
using zkr::domain::ProofRequest;
using zkr::domain::Venue;

namespace {

constexpr std::int64_t kStartMs = 1700000000123;
const char* const kStartText = "2023-11-14T22:13:20.123Z";

ProofRequest makeRequest(Venue venue, ClaimType claim_type) {
  ProofRequest request;
  request.venue = venue;
  request.claim_type = claim_type;
  request.account_ref = "acct-1";
  request.order_ref = "ord-1";
  if (claim_type == ClaimType::TradeExecuted) {
    request.execution_ref = "exec-1";
  }
  return request;
}

bool hasTag(const zkr::domain::EvidenceBundle& bundle, const std::string& tag) {
  return bundle.observed_tags.count(tag) != 0;
}

}  // namespace

class SyntheticAdapterTest : public ::testing::Test {
 protected:
  zkr::SimulationTimeProvider clock{kStartMs};
  zkr::adapter::SyntheticVenueAdapter hyperliquid{Venue::Hyperliquid, clock};
  zkr::adapter::SyntheticVenueAdapter base{Venue::Base, clock};
};

TEST_F(SyntheticAdapterTest, AcknowledgementFields) {
  auto ack = base.acknowledge(makeRequest(Venue::Base, ClaimType::OrderPlaced));

  EXPECT_TRUE(ack.accepted);
  EXPECT_EQ(ack.venue_order_ref, "ord-1");
  EXPECT_EQ(ack.accepted_at, kStartText);
  EXPECT_EQ(ack.acceptance_artifact_ref, "base://ack/ord-1");
  EXPECT_EQ(ack.acceptance_artifact_hash,
            zkr::integrity::hashJson({{"venue", "base"},
                                      {"order_ref", "ord-1"},
                                      {"accepted_at", kStartText},
                                      {"kind", "acknowledgement"}}));
}

// -----------------------------------------------------------------------------
// Hyperliquid evidence is a signed attestation; chain venues read chain state.
// -----------------------------------------------------------------------------
TEST_F(SyntheticAdapterTest, SourceKindsPerVenue) {
  auto request = makeRequest(Venue::Hyperliquid, ClaimType::OrderPlaced);
  auto hl = hyperliquid.collectEvidence(request, hyperliquid.acknowledge(request));
  ASSERT_EQ(hl.items.size(), 2u);
  EXPECT_EQ(hl.items[0].source_id, "hyperliquid-primary");
  EXPECT_EQ(hl.items[0].source_kind, "venue_signed_attestation");
  EXPECT_EQ(hl.items[1].source_id, "hyperliquid-api");
  EXPECT_EQ(hl.items[1].source_kind, "venue_api_unsigned");
  EXPECT_EQ(hl.items[1].artifact_ref, "hyperliquid://api/order/ord-1");

  request.venue = Venue::Base;
  auto chain = base.collectEvidence(request, base.acknowledge(request));
  EXPECT_EQ(chain.items[0].source_kind, "canonical_chain_state");
  EXPECT_EQ(chain.items[0].artifact_ref, "base://ack/ord-1");
}

TEST_F(SyntheticAdapterTest, OrderPlacedEvidence) {
  auto request = makeRequest(Venue::Base, ClaimType::OrderPlaced);
  auto bundle = base.collectEvidence(request, base.acknowledge(request));

  EXPECT_TRUE(hasTag(bundle, "order_identity"));
  EXPECT_TRUE(hasTag(bundle, "submission_timestamp"));
  EXPECT_TRUE(hasTag(bundle, "venue_acceptance_artifact"));
  EXPECT_FALSE(hasTag(bundle, "execution_identity"));
  EXPECT_TRUE(bundle.conflicts.empty());
  EXPECT_FALSE(bundle.finality_observed_at.has_value());
}

TEST_F(SyntheticAdapterTest, TradeExecutedAddsExecutionItemAndFinality) {
  auto request = makeRequest(Venue::Base, ClaimType::TradeExecuted);
  auto bundle = base.collectEvidence(request, base.acknowledge(request));

  ASSERT_EQ(bundle.items.size(), 3u);
  const auto& execution = bundle.items[2];
  EXPECT_EQ(execution.source_id, "base-execution");
  EXPECT_EQ(execution.artifact_ref, "base://execution/exec-1");
  EXPECT_TRUE(hasTag(bundle, "execution_identity"));
  EXPECT_TRUE(hasTag(bundle, "execution_timestamp"));
  EXPECT_TRUE(hasTag(bundle, "execution_artifact"));
  EXPECT_EQ(bundle.finality_observed_at, std::string(kStartText));
}

TEST_F(SyntheticAdapterTest, TradeExecutedWithoutExecutionRefHasNoExecutionTags) {
  auto request = makeRequest(Venue::Base, ClaimType::TradeExecuted);
  request.execution_ref.reset();
  auto bundle = base.collectEvidence(request, base.acknowledge(request));

  EXPECT_EQ(bundle.items.size(), 2u);
  EXPECT_FALSE(hasTag(bundle, "execution_identity"));
  EXPECT_FALSE(bundle.finality_observed_at.has_value());
}

// -----------------------------------------------------------------------------
// Payload switches.
// -----------------------------------------------------------------------------
TEST_F(SyntheticAdapterTest, SimulatedConflict) {
  auto request = makeRequest(Venue::Base, ClaimType::OrderPlaced);
  request.payload = {{"simulate_conflict", true}};
  auto bundle = base.collectEvidence(request, base.acknowledge(request));

  ASSERT_EQ(bundle.conflicts.size(), 1u);
  EXPECT_EQ(bundle.conflicts[0], "source_value_mismatch");
}

TEST_F(SyntheticAdapterTest, MissingTagsAreWithdrawn) {
  auto request = makeRequest(Venue::Base, ClaimType::TradeExecuted);
  request.payload = {
      {"missing_tags", nlohmann::json::array({"execution_artifact", 3})}};
  auto bundle = base.collectEvidence(request, base.acknowledge(request));

  EXPECT_FALSE(hasTag(bundle, "execution_artifact"));
  EXPECT_TRUE(hasTag(bundle, "execution_identity"));
  // Items keep their own tags.
  EXPECT_EQ(bundle.items.size(), 3u);
}

TEST_F(SyntheticAdapterTest, SimulatedFailuresThrow) {
  auto request = makeRequest(Venue::Base, ClaimType::OrderPlaced);

  request.payload = {{"simulate_ack_failure", true}};
  EXPECT_THROW(base.acknowledge(request), std::runtime_error);

  request.payload = {{"simulate_evidence_failure", true}};
  auto ack = base.acknowledge(request);
  EXPECT_THROW(base.collectEvidence(request, ack), std::runtime_error);
}

TEST_F(SyntheticAdapterTest, NonBooleanSwitchIsIgnored) {
  auto request = makeRequest(Venue::Base, ClaimType::OrderPlaced);
  request.payload = {{"simulate_ack_failure", "yes"}};
  EXPECT_NO_THROW(base.acknowledge(request));
}

TEST_F(SyntheticAdapterTest, DefaultStatements) {
  auto placed = makeRequest(Venue::Hyperliquid, ClaimType::OrderPlaced);
  auto ack = hyperliquid.acknowledge(placed);
  auto bundle = hyperliquid.collectEvidence(placed, ack);
  EXPECT_EQ(hyperliquid.buildStatement(placed, ack, bundle),
            std::string("Order ord-1 for account acct-1 was accepted on venue "
                        "hyperliquid at ") +
                kStartText + ".");

  auto executed = makeRequest(Venue::Hyperliquid, ClaimType::TradeExecuted);
  EXPECT_EQ(hyperliquid.buildStatement(executed, ack, bundle),
            "Order ord-1 for account acct-1 was executed on venue hyperliquid "
            "with execution ref exec-1.");

  executed.execution_ref.reset();
  EXPECT_EQ(hyperliquid.buildStatement(executed, ack, bundle),
            "Order ord-1 for account acct-1 was executed on venue hyperliquid "
            "with execution ref UNKNOWN.");
}

// -----------------------------------------------------------------------------
// Same clock, same request: identical evidence root. A different time
// changes the acknowledgement hash and therefore the root.
// -----------------------------------------------------------------------------
TEST_F(SyntheticAdapterTest, ReproducibleOnSimulatedClock) {
  auto request = makeRequest(Venue::Solana, ClaimType::TradeExecuted);
  zkr::adapter::SyntheticVenueAdapter solana(Venue::Solana, clock);

  auto first = solana.collectEvidence(request, solana.acknowledge(request));
  auto second = solana.collectEvidence(request, solana.acknowledge(request));
  EXPECT_EQ(first.evidenceRoot(), second.evidenceRoot());

  clock.advance_time(kStartMs + 1000);
  auto later = solana.collectEvidence(request, solana.acknowledge(request));
  EXPECT_NE(first.evidenceRoot(), later.evidenceRoot());
}
