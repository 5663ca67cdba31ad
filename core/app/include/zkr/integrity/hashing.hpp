#pragma once

#include "zkr/domain/proof_request.hpp"
#include "zkr/domain/receipt.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace zkr {
namespace integrity {

// -----------------------------------------------------------------------------
// Hashing primitives
// -----------------------------------------------------------------------------
//
// @brief  SHA-256 based helpers that produce every hash stored in a receipt.
//
// @details
// All hashes are rendered as "0x" followed by 64 lowercase hex digits.
//
// Canonical JSON: hashJson() hashes canonicalJson(value), which is the
// compact serialisation (no whitespace) with object keys in ascending byte
// order. nlohmann::json's default object type is an ordered std::map, so
// dump() already emits sorted keys; canonicalJson() is the single place
// that relies on this, and the unit tests pin the exact bytes so any change
// in that behaviour is caught.
//
// Thread-safety: All functions are stateless and safe to call concurrently.
// Errors: OpenSSL digest failures throw std::runtime_error.
// -----------------------------------------------------------------------------

// "0x" + sha256(input) in lowercase hex.
std::string hashString(std::string_view input);

// Compact, key-sorted JSON text used as the hashing pre-image.
std::string canonicalJson(const nlohmann::json& value);

// hashString(canonicalJson(value)).
std::string hashJson(const nlohmann::json& value);

// "0x" followed by 64 zeros. Placeholder for absent proofs.
const std::string& zeroHash();

// -------------------------------------------------------------------------
// pendingClaimHash(request)
// -------------------------------------------------------------------------
// @brief  Claim hash recorded on a freshly submitted (PENDING) receipt.
//
// @return hash_json({venue, claim_type, account_ref, order_ref,
//         execution_ref}) with execution_ref null when absent.
// -------------------------------------------------------------------------
std::string pendingClaimHash(const domain::ProofRequest& request);

// -------------------------------------------------------------------------
// statementClaimHash(claim_type, statement, order_ref, execution_ref)
// -------------------------------------------------------------------------
// @brief  Claim hash recomputed once the adapter has produced a statement.
//         Replaces the pending claim hash on the finalized receipt.
// -------------------------------------------------------------------------
std::string statementClaimHash(domain::ClaimType claim_type,
                               const std::string& statement,
                               const std::string& order_ref,
                               const std::optional<std::string>& execution_ref);

// Evidence root of a receipt that has no evidence yet:
// hash_json({"empty": true}).
std::string emptyEvidenceRoot();

// -------------------------------------------------------------------------
// publicInputs(claim_hash, evidence_root, venue, claim_type)
// -------------------------------------------------------------------------
// @brief  The public-input object handed to the prover and recomputed by
//         the verifier. Venue and claim type use their canonical strings.
// -------------------------------------------------------------------------
nlohmann::json publicInputs(const std::string& claim_hash,
                            const std::string& evidence_root,
                            domain::Venue venue,
                            domain::ClaimType claim_type);

// -------------------------------------------------------------------------
// buildIntegrity(signer, version, status, claim_hash, evidence_root,
//                proof_hash)
// -------------------------------------------------------------------------
//
// @brief  Computes the full Integrity block from its inputs.
//
// @details
// Pure function: identical inputs always yield an identical Integrity.
// Callers must invoke it again after changing any of status, claim hash,
// evidence root or proof hash.
// -------------------------------------------------------------------------
domain::Integrity buildIntegrity(const std::string& signer,
                                 const std::string& receipt_version,
                                 domain::ReceiptStatus status,
                                 const std::string& claim_hash,
                                 const std::string& evidence_root,
                                 const std::string& proof_hash);

// Recomputes receipt.integrity from the receipt's own fields.
void resealReceipt(domain::ZKReceipt& receipt, const std::string& signer);

}  // namespace integrity
}  // namespace zkr
