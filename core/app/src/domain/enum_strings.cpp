#include "zkr/domain/receipt_status.hpp"
#include "zkr/domain/venue.hpp"

namespace zkr {
namespace domain {

// -----------------------------------------------------------------------------
// Venue / ClaimType
// -----------------------------------------------------------------------------
const char* venueToString(Venue venue) {
  switch (venue) {
    case Venue::Hyperliquid: return "hyperliquid";
    case Venue::Base:        return "base";
    case Venue::Solana:      return "solana";
    case Venue::Polymarket:  return "polymarket";
  }
  return "unknown";
}

const char* claimTypeToString(ClaimType claim_type) {
  switch (claim_type) {
    case ClaimType::OrderPlaced:   return "ORDER_PLACED";
    case ClaimType::TradeExecuted: return "TRADE_EXECUTED";
  }
  return "UNKNOWN";
}

std::optional<Venue> parseVenue(std::string_view text) {
  for (Venue venue : kAllVenues) {
    if (text == venueToString(venue)) {
      return venue;
    }
  }
  return std::nullopt;
}

std::optional<ClaimType> parseClaimType(std::string_view text) {
  if (text == claimTypeToString(ClaimType::OrderPlaced)) {
    return ClaimType::OrderPlaced;
  }
  if (text == claimTypeToString(ClaimType::TradeExecuted)) {
    return ClaimType::TradeExecuted;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// ReceiptStatus
// -----------------------------------------------------------------------------
const char* receiptStatusToString(ReceiptStatus status) {
  using S = ReceiptStatus;
  switch (status) {
    case S::Pending:     return "PENDING";
    case S::Proved:      return "PROVED";
    case S::NonProvable: return "NON_PROVABLE";
    case S::Invalidated: return "INVALIDATED";
  }
  return "UNKNOWN";
}

bool isTerminal(ReceiptStatus status) {
  return status != ReceiptStatus::Pending;
}

// -----------------------------------------------------------------------------
// NonProvableReason
// -----------------------------------------------------------------------------
const char* nonProvableReasonToString(NonProvableReason reason) {
  using R = NonProvableReason;
  switch (reason) {
    case R::EvidenceMissing:       return "EVIDENCE_MISSING";
    case R::EvidenceConflict:      return "EVIDENCE_CONFLICT";
    case R::SourceUnavailable:     return "SOURCE_UNAVAILABLE";
    case R::FinalityTimeout:       return "FINALITY_TIMEOUT";
    case R::PolicyViolation:       return "POLICY_VIOLATION";
    case R::SchemaInvalid:         return "SCHEMA_INVALID";
    case R::UnsupportedVenueClaim: return "UNSUPPORTED_VENUE_CLAIM";
    case R::ProofFailure:          return "PROOF_FAILURE";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// ProofBackend / VerificationMode
// -----------------------------------------------------------------------------
const char* proofBackendToString(ProofBackend backend) {
  switch (backend) {
    case ProofBackend::Sp1:  return "SP1";
    case ProofBackend::Pico: return "PICO";
    case ProofBackend::None: return "NONE";
  }
  return "UNKNOWN";
}

const char* verificationModeToString(VerificationMode mode) {
  using M = VerificationMode;
  switch (mode) {
    case M::Offchain:            return "OFFCHAIN";
    case M::OnchainAnchored:     return "ONCHAIN_ANCHORED";
    case M::OffchainAndAnchored: return "OFFCHAIN_AND_ANCHORED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace zkr
