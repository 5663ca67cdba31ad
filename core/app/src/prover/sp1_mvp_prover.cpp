#include "zkr/prover/sp1_mvp_prover.hpp"

#include "zkr/integrity/hashing.hpp"

namespace zkr {
namespace prover {

domain::ProofMetadata Sp1MvpProver::prove(const nlohmann::json& public_inputs) {
  domain::ProofMetadata proof;
  proof.backend = domain::ProofBackend::Sp1;
  proof.circuit_id = "trade-receipt-sp1";
  proof.circuit_version = "v0.1.0";
  proof.verifier_key_id = "sp1-vk-001";
  proof.verifier_key_hash =
      integrity::hashJson({{"backend", "SP1"}, {"verifier_key", "001"}});
  proof.public_inputs_hash = integrity::hashJson(public_inputs);
  proof.verification_mode = domain::VerificationMode::Offchain;
  proof.proof_artifact_ref = "boundless://sp1/" + proof.public_inputs_hash;
  return proof;
}

}  // namespace prover
}  // namespace zkr
