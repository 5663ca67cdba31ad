#pragma once

#include "zkr/domain/evidence.hpp"
#include "zkr/domain/proof_request.hpp"
#include "zkr/domain/venue.hpp"

#include <string>

namespace zkr {
namespace adapter {

// -----------------------------------------------------------------------------
// IVenueAdapter: per-venue acknowledgement, evidence and statement source
// -----------------------------------------------------------------------------
//
// @brief  The pluggable boundary between ReceiptEngine and a trading venue.
//
// @details
// ReceiptEngine keeps one adapter per Venue and calls, for each request, in
// order and at most once each:
//   1. acknowledge(request)                   → ExecutionAck
//   2. collectEvidence(request, ack)          → EvidenceBundle
//   3. buildStatement(request, ack, bundle)   → statement text
//
// Failure reporting:
//   Every method reports failure by throwing an exception derived from
//   std::exception; what() becomes the details of the NON_PROVABLE receipt.
//   acknowledge/collectEvidence failures map to SOURCE_UNAVAILABLE,
//   buildStatement failures to POLICY_VIOLATION.
//
// Ownership:
//   Held by ReceiptEngine via std::shared_ptr, so tests can keep a handle
//   to a spy adapter and inspect it after the pipeline has run.
//
// Thread model:
//   Called from WorkerPool threads; several pipelines for the same venue
//   may call one adapter concurrently. Implementations must be thread-safe.
// -----------------------------------------------------------------------------
class IVenueAdapter {
 public:
  virtual ~IVenueAdapter() = default;

  virtual domain::Venue venue() const = 0;

  virtual domain::ExecutionAck acknowledge(const domain::ProofRequest& request) = 0;

  virtual domain::EvidenceBundle collectEvidence(const domain::ProofRequest& request,
                                                 const domain::ExecutionAck& ack) = 0;

  // -------------------------------------------------------------------------
  // buildStatement(request, ack, bundle)
  // -------------------------------------------------------------------------
  // @brief  Human-readable statement of the claim.
  //
  // @details
  // Default:
  //   ORDER_PLACED:   "Order <order_ref> for account <account_ref> was
  //                    accepted on venue <venue> at <accepted_at>."
  //   TRADE_EXECUTED: "Order <order_ref> for account <account_ref> was
  //                    executed on venue <venue> with execution ref
  //                    <execution_ref | UNKNOWN>."
  // Overrides must return a non-empty string and be deterministic for
  // identical inputs.
  // -------------------------------------------------------------------------
  virtual std::string buildStatement(const domain::ProofRequest& request,
                                     const domain::ExecutionAck& ack,
                                     const domain::EvidenceBundle& bundle);
};

}  // namespace adapter
}  // namespace zkr
