#include "zkr/prover/i_prover.hpp"

#include "zkr/integrity/hashing.hpp"

namespace zkr {
namespace prover {

domain::ProofMetadata noProofMetadata() {
  domain::ProofMetadata proof;
  proof.backend = domain::ProofBackend::None;
  proof.circuit_id = "none";
  proof.circuit_version = "none";
  proof.verifier_key_id = "none";
  proof.verifier_key_hash = integrity::zeroHash();
  proof.public_inputs_hash = integrity::zeroHash();
  proof.verification_mode = domain::VerificationMode::Offchain;
  return proof;
}

}  // namespace prover
}  // namespace zkr
