#include "zkr/domain/receipt_json.hpp"

#include <stdexcept>

namespace zkr {
namespace domain {

namespace {

nlohmann::json optionalString(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

void to_json(nlohmann::json& j, const EvidenceItem& item) {
  j = nlohmann::json{
      {"source_id", item.source_id},
      {"source_kind", item.source_kind},
      {"artifact_ref", item.artifact_ref},
      {"artifact_hash", item.artifact_hash},
      {"observed_at", item.observed_at},
      {"tags", item.tags},
  };
}

void to_json(nlohmann::json& j, const TruthClaim& claim) {
  j = nlohmann::json{
      {"type", claimTypeToString(claim.type)},
      {"statement", claim.statement},
      {"claim_hash", claim.claim_hash},
  };
}

void to_json(nlohmann::json& j, const Subject& subject) {
  j = nlohmann::json{
      {"venue", venueToString(subject.venue)},
      {"account_ref", subject.account_ref},
      {"order_ref", subject.order_ref},
      {"execution_ref", optionalString(subject.execution_ref)},
  };
}

void to_json(nlohmann::json& j, const PolicyContext& policy) {
  j = nlohmann::json{
      {"policy_id", policy.policy_id},
      {"finality_rule_id", policy.finality_rule_id},
      {"source_precedence_version", policy.source_precedence_version},
  };
}

void to_json(nlohmann::json& j, const Provenance& provenance) {
  j = nlohmann::json{
      {"evidence_root", provenance.evidence_root},
      {"evidence_items", provenance.evidence_items},
  };
}

void to_json(nlohmann::json& j, const Timing& timing) {
  j = nlohmann::json{
      {"created_at", timing.created_at},
      {"updated_at", timing.updated_at},
      {"execution_observed_at", optionalString(timing.execution_observed_at)},
      {"finality_observed_at", optionalString(timing.finality_observed_at)},
  };
}

void to_json(nlohmann::json& j, const ProofMetadata& proof) {
  j = nlohmann::json{
      {"backend", proofBackendToString(proof.backend)},
      {"circuit_id", proof.circuit_id},
      {"circuit_version", proof.circuit_version},
      {"verifier_key_id", proof.verifier_key_id},
      {"verifier_key_hash", proof.verifier_key_hash},
      {"public_inputs_hash", proof.public_inputs_hash},
      {"verification_mode", verificationModeToString(proof.verification_mode)},
      {"proof_artifact_ref", optionalString(proof.proof_artifact_ref)},
      {"anchored_root_ref", optionalString(proof.anchored_root_ref)},
  };
}

void to_json(nlohmann::json& j, const Integrity& integrity) {
  j = nlohmann::json{
      {"schema_hash", integrity.schema_hash},
      {"receipt_hash", integrity.receipt_hash},
      {"signer", integrity.signer},
      {"signature", integrity.signature},
  };
}

void to_json(nlohmann::json& j, const NonProvable& non_provable) {
  j = nlohmann::json{
      {"reason_code", nonProvableReasonToString(non_provable.reason_code)},
      {"details", non_provable.details},
  };
}

void to_json(nlohmann::json& j, const ZKReceipt& receipt) {
  j = nlohmann::json{
      {"receipt_id", receipt.receipt_id},
      {"version", receipt.version},
      {"status", receiptStatusToString(receipt.status)},
      {"claim", receipt.claim},
      {"subject", receipt.subject},
      {"policy", receipt.policy},
      {"provenance", receipt.provenance},
      {"timing", receipt.timing},
      {"proof", receipt.proof},
      {"integrity", receipt.integrity},
  };
  if (receipt.non_provable) {
    j["non_provable"] = *receipt.non_provable;
  } else {
    j["non_provable"] = nullptr;
  }
}

void to_json(nlohmann::json& j, const ProofRequest& request) {
  j = nlohmann::json{
      {"venue", venueToString(request.venue)},
      {"claim_type", claimTypeToString(request.claim_type)},
      {"account_ref", request.account_ref},
      {"order_ref", request.order_ref},
      {"execution_ref", optionalString(request.execution_ref)},
      {"payload", request.payload},
  };
}

void from_json(const nlohmann::json& j, ProofRequest& request) {
  const auto venue_text = j.at("venue").get<std::string>();
  auto venue = parseVenue(venue_text);
  if (!venue) {
    throw std::invalid_argument("invalid venue: " + venue_text);
  }

  const auto claim_text = j.at("claim_type").get<std::string>();
  auto claim_type = parseClaimType(claim_text);
  if (!claim_type) {
    throw std::invalid_argument("invalid claim_type: " + claim_text);
  }

  request.venue = *venue;
  request.claim_type = *claim_type;
  request.account_ref = j.at("account_ref").get<std::string>();
  request.order_ref = j.at("order_ref").get<std::string>();

  auto exec = j.find("execution_ref");
  if (exec != j.end() && !exec->is_null()) {
    request.execution_ref = exec->get<std::string>();
  } else {
    request.execution_ref.reset();
  }

  auto payload = j.find("payload");
  request.payload = (payload != j.end() && !payload->is_null())
                        ? *payload
                        : nlohmann::json::object();
}

}  // namespace domain
}  // namespace zkr
