#pragma once

#include "zkr/verifier/i_receipt_verifier.hpp"

namespace zkr {
namespace verifier {

// -----------------------------------------------------------------------------
// OffchainVerifier
// -----------------------------------------------------------------------------
//
// @brief  Recomputes the public-input hash from the receipt and compares it
//         with proof.public_inputs_hash.
//
// @details
// Returns false unless:
//   - status is PROVED,
//   - proof.backend is not None, and
//   - hash_json({claim_hash, evidence_root, venue, claim_type}) equals
//     proof.public_inputs_hash.
//
// Side-effects: None. Repeated calls on the same receipt agree.
// -----------------------------------------------------------------------------
class OffchainVerifier final : public IReceiptVerifier {
 public:
  bool verify(const domain::ZKReceipt& receipt) const override;
};

}  // namespace verifier
}  // namespace zkr
