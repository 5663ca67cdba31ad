#include "zkr/verifier/offchain_verifier.hpp"

#include "zkr/integrity/hashing.hpp"

namespace zkr {
namespace verifier {

bool OffchainVerifier::verify(const domain::ZKReceipt& receipt) const {
  if (receipt.status != domain::ReceiptStatus::Proved) {
    return false;
  }
  if (receipt.proof.backend == domain::ProofBackend::None) {
    return false;
  }

  const std::string expected = integrity::hashJson(integrity::publicInputs(
      receipt.claim.claim_hash, receipt.provenance.evidence_root,
      receipt.subject.venue, receipt.claim.type));
  return expected == receipt.proof.public_inputs_hash;
}

}  // namespace verifier
}  // namespace zkr
