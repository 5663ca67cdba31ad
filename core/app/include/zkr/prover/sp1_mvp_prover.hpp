#pragma once

#include "zkr/prover/i_prover.hpp"

namespace zkr {
namespace prover {

// -----------------------------------------------------------------------------
// Sp1MvpProver
// -----------------------------------------------------------------------------
// Hash-bound SP1 placeholder: no circuit is executed. The returned metadata
// names circuit "trade-receipt-sp1" v0.1.0 and verifier key "sp1-vk-001",
// binds public_inputs_hash to the given inputs and points the artifact ref
// at "boundless://sp1/<public_inputs_hash>".
// -----------------------------------------------------------------------------
class Sp1MvpProver final : public IProver {
 public:
  domain::ProofBackend backend() const override { return domain::ProofBackend::Sp1; }

  domain::ProofMetadata prove(const nlohmann::json& public_inputs) override;
};

}  // namespace prover
}  // namespace zkr
