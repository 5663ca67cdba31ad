#pragma once

#include "zkr/adapter/i_venue_adapter.hpp"
#include "zkr/time/i_time_provider.hpp"

namespace zkr {
namespace adapter {

// -----------------------------------------------------------------------------
// SyntheticVenueAdapter: deterministic stand-in for a real venue
// -----------------------------------------------------------------------------
//
// @brief  Fabricates acknowledgements and evidence for any venue without
//         network access. Used by the zk_receipts demo/server and by tests.
//
// @details
// acknowledge():
//   artifact ref  "<venue>://ack/<order_ref>"
//   artifact hash hash_json({venue, order_ref, accepted_at,
//                            kind: "acknowledgement"})
//
// collectEvidence() returns:
//   - "<venue>-primary": source kind venue_signed_attestation (hyperliquid)
//     or canonical_chain_state (other venues), tagged order_identity,
//     submission_timestamp, venue_acceptance_artifact;
//   - "<venue>-api": source kind venue_api_unsigned, tagged order_identity,
//     submission_timestamp;
//   - for TRADE_EXECUTED with an execution ref, "<venue>-execution" tagged
//     execution_identity, execution_timestamp, execution_artifact, and a
//     finality timestamp on the bundle.
//
// Request payload switches (all optional):
//   simulate_conflict: true          adds conflict "source_value_mismatch"
//   missing_tags: [..]               removes the tags from observed_tags
//   simulate_ack_failure: true       acknowledge() throws
//   simulate_evidence_failure: true  collectEvidence() throws
//
// Timestamps come from the injected ITimeProvider, so with a
// SimulationTimeProvider every hash is reproducible.
//
// Thread model: Stateless apart from the const clock reference; safe for
// concurrent use.
// -----------------------------------------------------------------------------
class SyntheticVenueAdapter final : public IVenueAdapter {
 public:
  // @param clock  Must outlive the adapter.
  SyntheticVenueAdapter(domain::Venue venue, const ITimeProvider& clock);

  domain::Venue venue() const override { return venue_; }

  domain::ExecutionAck acknowledge(const domain::ProofRequest& request) override;

  domain::EvidenceBundle collectEvidence(const domain::ProofRequest& request,
                                         const domain::ExecutionAck& ack) override;

 private:
  domain::Venue venue_;
  const ITimeProvider& clock_;
};

}  // namespace adapter
}  // namespace zkr
