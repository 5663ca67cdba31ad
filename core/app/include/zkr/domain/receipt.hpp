#pragma once

#include "zkr/domain/evidence.hpp"
#include "zkr/domain/receipt_status.hpp"
#include "zkr/domain/venue.hpp"

#include <optional>
#include <string>
#include <vector>

namespace zkr {
namespace domain {

// -----------------------------------------------------------------------------
// ReceiptId
// -----------------------------------------------------------------------------
// Textual RFC 4122 version-4 UUID, assigned once by ReceiptEngine::submit().
// -----------------------------------------------------------------------------
using ReceiptId = std::string;

// Human-readable claim plus the hash that binds it.
//
// claim_hash is first computed over the request's identifying fields when
// the PENDING receipt is created, then overwritten with the hash over
// (claim type, statement, order ref, execution ref) once the pipeline has a
// statement.
struct TruthClaim {
  ClaimType type{ClaimType::OrderPlaced};
  std::string statement;
  std::string claim_hash;
};

struct Subject {
  Venue venue{Venue::Hyperliquid};
  std::string account_ref;
  std::string order_ref;
  std::optional<std::string> execution_ref;
};

struct PolicyContext {
  std::string policy_id;
  std::string finality_rule_id;
  std::string source_precedence_version;
};

struct Provenance {
  std::string evidence_root;
  std::vector<EvidenceItem> evidence_items;
};

struct Timing {
  std::string created_at;
  std::string updated_at;
  std::optional<std::string> execution_observed_at;
  std::optional<std::string> finality_observed_at;
};

// -----------------------------------------------------------------------------
// ProofMetadata
// -----------------------------------------------------------------------------
// Responsibility: Backend-agnostic description of a produced proof.
//
// public_inputs_hash is the hash of the public inputs the prover was given.
// OffchainVerifier recomputes it from the receipt to check consistency.
//
// Receipts that are not (or no longer) proved carry placeholder metadata
// with backend None and all-zero hashes (see prover::noProofMetadata()).
// -----------------------------------------------------------------------------
struct ProofMetadata {
  ProofBackend backend{ProofBackend::None};
  std::string circuit_id;
  std::string circuit_version;
  std::string verifier_key_id;
  std::string verifier_key_hash;
  std::string public_inputs_hash;
  VerificationMode verification_mode{VerificationMode::Offchain};
  std::optional<std::string> proof_artifact_ref;
  std::optional<std::string> anchored_root_ref;
};

// -----------------------------------------------------------------------------
// Integrity
// -----------------------------------------------------------------------------
// Responsibility: Hash chain over the receipt's content.
//
//   schema_hash  = hash_json({schema, version})
//   receipt_hash = hash_json({status, claim_hash, evidence_root, proof_hash})
//   signature    = hash_json({signer, receipt_hash})
//
// The signature is a deterministic stand-in, not a real signature scheme.
// The whole struct is rebuilt by integrity::buildIntegrity() whenever any
// input changes; it is never patched field by field.
// -----------------------------------------------------------------------------
struct Integrity {
  std::string schema_hash;
  std::string receipt_hash;
  std::string signer;
  std::string signature;
};

struct NonProvable {
  NonProvableReason reason_code{NonProvableReason::PolicyViolation};
  std::string details;
};

// -----------------------------------------------------------------------------
// ZKReceipt
// -----------------------------------------------------------------------------
//
// @brief  The aggregate returned to callers: claim, subject, policy context,
//         evidence, proof and integrity, together with the lifecycle status.
//
// @details
// Ownership: the authoritative copy lives in ReceiptEngine's store. Every
// accessor returns a copy (snapshot); adapters, the prover and the verifier
// only ever see snapshots or produce values the engine folds back in.
//
// non_provable is set if and only if status == NonProvable.
// -----------------------------------------------------------------------------
struct ZKReceipt {
  ReceiptId receipt_id;
  std::string version;
  ReceiptStatus status{ReceiptStatus::Pending};
  TruthClaim claim;
  Subject subject;
  PolicyContext policy;
  Provenance provenance;
  Timing timing;
  ProofMetadata proof;
  Integrity integrity;
  std::optional<NonProvable> non_provable;
};

}  // namespace domain
}  // namespace zkr
