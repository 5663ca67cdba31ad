#include "zkr/integrity/hashing.hpp"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <stdexcept>

namespace zkr {
namespace integrity {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";
constexpr const char* kSchemaName = "zkreceipt.schema.json";

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string toPrefixedHex(const unsigned char* data, unsigned int size) {
  std::string out;
  out.reserve(2 + static_cast<std::size_t>(size) * 2);
  out += "0x";
  for (unsigned int i = 0; i < size; ++i) {
    out += kHexDigits[(data[i] >> 4) & 0x0f];
    out += kHexDigits[data[i] & 0x0f];
  }
  return out;
}

nlohmann::json optionalToJson(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

// -----------------------------------------------------------------------------
// hashString(): one-shot EVP SHA-256
// -----------------------------------------------------------------------------
std::string hashString(std::string_view input) {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;

  const bool ok =
      EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1 &&
      EVP_DigestUpdate(ctx.get(), input.data(), input.size()) == 1 &&
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) == 1;
  if (!ok) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  return toPrefixedHex(digest.data(), digest_len);
}

std::string canonicalJson(const nlohmann::json& value) {
  // dump() with the default indent (-1) is compact; std::map-backed objects
  // iterate in ascending key order.
  return value.dump();
}

std::string hashJson(const nlohmann::json& value) {
  return hashString(canonicalJson(value));
}

const std::string& zeroHash() {
  static const std::string kZero = "0x" + std::string(64, '0');
  return kZero;
}

// -----------------------------------------------------------------------------
// Claim hashes
// -----------------------------------------------------------------------------
std::string pendingClaimHash(const domain::ProofRequest& request) {
  return hashJson({
      {"venue", domain::venueToString(request.venue)},
      {"claim_type", domain::claimTypeToString(request.claim_type)},
      {"account_ref", request.account_ref},
      {"order_ref", request.order_ref},
      {"execution_ref", optionalToJson(request.execution_ref)},
  });
}

std::string statementClaimHash(
    domain::ClaimType claim_type, const std::string& statement,
    const std::string& order_ref,
    const std::optional<std::string>& execution_ref) {
  return hashJson({
      {"claim_type", domain::claimTypeToString(claim_type)},
      {"statement", statement},
      {"order_ref", order_ref},
      {"execution_ref", optionalToJson(execution_ref)},
  });
}

std::string emptyEvidenceRoot() {
  return hashJson({{"empty", true}});
}

nlohmann::json publicInputs(const std::string& claim_hash,
                            const std::string& evidence_root,
                            domain::Venue venue,
                            domain::ClaimType claim_type) {
  return {
      {"claim_hash", claim_hash},
      {"evidence_root", evidence_root},
      {"venue", domain::venueToString(venue)},
      {"claim_type", domain::claimTypeToString(claim_type)},
  };
}

// -----------------------------------------------------------------------------
// Integrity chain
// -----------------------------------------------------------------------------
domain::Integrity buildIntegrity(const std::string& signer,
                                 const std::string& receipt_version,
                                 domain::ReceiptStatus status,
                                 const std::string& claim_hash,
                                 const std::string& evidence_root,
                                 const std::string& proof_hash) {
  domain::Integrity integrity;
  integrity.schema_hash =
      hashJson({{"schema", kSchemaName}, {"version", receipt_version}});
  integrity.receipt_hash = hashJson({
      {"status", domain::receiptStatusToString(status)},
      {"claim_hash", claim_hash},
      {"evidence_root", evidence_root},
      {"proof_hash", proof_hash},
  });
  integrity.signer = signer;
  integrity.signature =
      hashJson({{"signer", signer}, {"receipt_hash", integrity.receipt_hash}});
  return integrity;
}

void resealReceipt(domain::ZKReceipt& receipt, const std::string& signer) {
  receipt.integrity = buildIntegrity(
      signer, receipt.version, receipt.status, receipt.claim.claim_hash,
      receipt.provenance.evidence_root, receipt.proof.public_inputs_hash);
}

}  // namespace integrity
}  // namespace zkr
