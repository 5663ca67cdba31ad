#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace zkr {
namespace policy {

// -----------------------------------------------------------------------------
// PolicyDocumentError
// -----------------------------------------------------------------------------
// Thrown when a policy document cannot be read, parsed, or fails schema
// validation. The message names the file (when loaded from disk) and the
// offending field.
// -----------------------------------------------------------------------------
class PolicyDocumentError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// Policy documents
// -----------------------------------------------------------------------------
//
// @brief  Loading, validation and built-in defaults for the two documents
//         PolicyEngine is constructed from.
//
// @details
// Claim taxonomy:
//   { "claim_types": { "ORDER_PLACED":   { "required_evidence_tags_all": [..] },
//                      "TRADE_EXECUTED": { "required_evidence_tags_all": [..] } },
//     "non_provable_reason_codes": [ <exactly the eight reason codes> ] }
//
// Source precedence:
//   { "version": "...",
//     "venues": { "<venue>": { "order_placed_sources_preferred":   [..],
//                              "trade_executed_sources_preferred": [..] } } }
//   Every known venue must be present; unknown venue keys are rejected.
//
// Thread-safety: All functions are stateless.
// -----------------------------------------------------------------------------

// Reads and parses a JSON file. Throws PolicyDocumentError naming the path
// if the file cannot be opened or does not parse.
nlohmann::json loadPolicyDocument(const std::string& path);

// Throw PolicyDocumentError describing the first violation found.
void validateClaimTaxonomy(const nlohmann::json& document);
void validateSourcePrecedence(const nlohmann::json& document);

// Built-in documents; both pass validation.
nlohmann::json defaultClaimTaxonomy();
nlohmann::json defaultSourcePrecedence();

}  // namespace policy
}  // namespace zkr
