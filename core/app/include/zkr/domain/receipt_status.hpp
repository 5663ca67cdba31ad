#pragma once

namespace zkr {
namespace domain {

// -----------------------------------------------------------------------------
// ReceiptStatus
// -----------------------------------------------------------------------------
// Responsibility: Lifecycle state of a ZKReceipt.
//
// Legal transitions:
//   Pending → Proved
//   Pending → NonProvable
//   Proved, NonProvable → (none, terminal)
//
// Invalidated is part of the published taxonomy for a future revocation
// flow. The pipeline never produces it.
// -----------------------------------------------------------------------------
enum class ReceiptStatus {
  Pending,      // Created by submit(), pipeline not finished
  Proved,       // Evidence accepted, proof produced and verified, terminal
  NonProvable,  // Pipeline stopped with a reason code, terminal
  Invalidated,  // Reserved
};

// -----------------------------------------------------------------------------
// NonProvableReason
// -----------------------------------------------------------------------------
// Responsibility: Closed reason-code enumeration carried by NON_PROVABLE
// receipts. The claim taxonomy document must list exactly these codes.
//
// FinalityTimeout and SchemaInvalid are reserved and not produced by the
// pipeline.
// -----------------------------------------------------------------------------
enum class NonProvableReason {
  EvidenceMissing,
  EvidenceConflict,
  SourceUnavailable,
  FinalityTimeout,
  PolicyViolation,
  SchemaInvalid,
  UnsupportedVenueClaim,
  ProofFailure,
};

inline constexpr NonProvableReason kAllNonProvableReasons[] = {
    NonProvableReason::EvidenceMissing,
    NonProvableReason::EvidenceConflict,
    NonProvableReason::SourceUnavailable,
    NonProvableReason::FinalityTimeout,
    NonProvableReason::PolicyViolation,
    NonProvableReason::SchemaInvalid,
    NonProvableReason::UnsupportedVenueClaim,
    NonProvableReason::ProofFailure,
};

// Proof system that produced a receipt's proof metadata. None is the
// sentinel for "not proved" (pending or failed receipts).
enum class ProofBackend {
  Sp1,
  Pico,
  None,
};

// How a proof is meant to be checked. Only Offchain is produced; the
// anchored modes are reserved for on-chain anchoring.
enum class VerificationMode {
  Offchain,
  OnchainAnchored,
  OffchainAndAnchored,
};

const char* receiptStatusToString(ReceiptStatus status);
const char* nonProvableReasonToString(NonProvableReason reason);
const char* proofBackendToString(ProofBackend backend);
const char* verificationModeToString(VerificationMode mode);

// -------------------------------------------------------------------------
// isTerminal(status)
// -------------------------------------------------------------------------
// @brief  True for every status except Pending.
// -------------------------------------------------------------------------
bool isTerminal(ReceiptStatus status);

}  // namespace domain
}  // namespace zkr
