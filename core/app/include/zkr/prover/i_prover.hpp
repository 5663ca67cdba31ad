#pragma once

#include "zkr/domain/receipt.hpp"

#include <nlohmann/json.hpp>

namespace zkr {
namespace prover {

// -----------------------------------------------------------------------------
// IProver: proving backend boundary
// -----------------------------------------------------------------------------
//
// @brief  Turns the public inputs of a claim into proof metadata.
//
// @details
// The public inputs are {claim_hash, evidence_root, venue, claim_type}
// (see integrity::publicInputs()). An implementation must set
// public_inputs_hash to integrity::hashJson(public_inputs); otherwise the
// verifier rejects the receipt and it is downgraded to PROOF_FAILURE.
//
// Failure: throw an exception derived from std::exception. ReceiptEngine
// records what() as the details of a PROOF_FAILURE receipt.
//
// Thread model: prove() may be called concurrently from WorkerPool threads.
// -----------------------------------------------------------------------------
class IProver {
 public:
  virtual ~IProver() = default;

  virtual domain::ProofBackend backend() const = 0;

  virtual domain::ProofMetadata prove(const nlohmann::json& public_inputs) = 0;
};

// Placeholder metadata carried by PENDING and NON_PROVABLE receipts:
// backend None, identifiers "none", all-zero hashes, mode OFFCHAIN.
domain::ProofMetadata noProofMetadata();

}  // namespace prover
}  // namespace zkr
