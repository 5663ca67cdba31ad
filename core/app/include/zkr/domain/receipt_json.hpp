#pragma once

#include "zkr/domain/evidence.hpp"
#include "zkr/domain/proof_request.hpp"
#include "zkr/domain/receipt.hpp"

#include <nlohmann/json.hpp>

namespace zkr {
namespace domain {

// -----------------------------------------------------------------------------
// Receipt wire shape
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json ADL hooks for the receipt aggregate and the request
//         type accepted by the command server.
//
// @details
// Enumerated fields serialise as their canonical strings (lowercase venue
// slug, upper snake case for claim type, status, reason, backend and
// verification mode). Absent optionals serialise as null so every key is
// always present.
//
// Usage: nlohmann::json j = receipt;  or  auto r = j.get<ProofRequest>();
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const EvidenceItem& item);
void to_json(nlohmann::json& j, const TruthClaim& claim);
void to_json(nlohmann::json& j, const Subject& subject);
void to_json(nlohmann::json& j, const PolicyContext& policy);
void to_json(nlohmann::json& j, const Provenance& provenance);
void to_json(nlohmann::json& j, const Timing& timing);
void to_json(nlohmann::json& j, const ProofMetadata& proof);
void to_json(nlohmann::json& j, const Integrity& integrity);
void to_json(nlohmann::json& j, const NonProvable& non_provable);
void to_json(nlohmann::json& j, const ZKReceipt& receipt);

void to_json(nlohmann::json& j, const ProofRequest& request);

// -------------------------------------------------------------------------
// from_json(j, request)
// -------------------------------------------------------------------------
// @brief  Parses a request object {venue, claim_type, account_ref,
//         order_ref, execution_ref?, payload?}.
//
// @details
// Throws nlohmann::json::exception for missing or mistyped keys and
// std::invalid_argument for a venue or claim type that is not a canonical
// string. A null execution_ref is treated as absent.
// -------------------------------------------------------------------------
void from_json(const nlohmann::json& j, ProofRequest& request);

}  // namespace domain
}  // namespace zkr
