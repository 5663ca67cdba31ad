#include "zkr/policy/policy_documents.hpp"

#include "zkr/domain/receipt_status.hpp"
#include "zkr/domain/venue.hpp"

#include <fstream>
#include <initializer_list>
#include <set>

namespace zkr {
namespace policy {

namespace {

void requireStringArray(const nlohmann::json& value, const std::string& field) {
  if (!value.is_array()) {
    throw PolicyDocumentError(field + " must be an array of strings");
  }
  for (const auto& entry : value) {
    if (!entry.is_string()) {
      throw PolicyDocumentError(field + " must be an array of strings");
    }
  }
}

const nlohmann::json& requireMember(const nlohmann::json& object,
                                    const std::string& key,
                                    const std::string& field) {
  if (!object.is_object() || !object.contains(key)) {
    throw PolicyDocumentError("missing field " + field);
  }
  return object.at(key);
}

nlohmann::json venuePreference(std::initializer_list<const char*> order_placed,
                               std::initializer_list<const char*> trade_executed) {
  nlohmann::json entry = nlohmann::json::object();
  entry["order_placed_sources_preferred"] = nlohmann::json::array();
  entry["trade_executed_sources_preferred"] = nlohmann::json::array();
  for (const char* kind : order_placed) {
    entry["order_placed_sources_preferred"].push_back(kind);
  }
  for (const char* kind : trade_executed) {
    entry["trade_executed_sources_preferred"].push_back(kind);
  }
  return entry;
}

}  // namespace

nlohmann::json loadPolicyDocument(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw PolicyDocumentError("failed to read " + path);
  }

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw PolicyDocumentError("failed to parse json " + path + ": " + e.what());
  }
}

// -----------------------------------------------------------------------------
// validateClaimTaxonomy
// -----------------------------------------------------------------------------
void validateClaimTaxonomy(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw PolicyDocumentError("claim taxonomy must be a JSON object");
  }

  const auto& claim_types = requireMember(document, "claim_types", "claim_types");
  for (const char* claim : {domain::claimTypeToString(domain::ClaimType::OrderPlaced),
                            domain::claimTypeToString(domain::ClaimType::TradeExecuted)}) {
    const std::string field = std::string("claim_types.") + claim;
    const auto& entry = requireMember(claim_types, claim, field);
    requireStringArray(
        requireMember(entry, "required_evidence_tags_all",
                      field + ".required_evidence_tags_all"),
        field + ".required_evidence_tags_all");
  }

  const auto& codes = requireMember(document, "non_provable_reason_codes",
                                    "non_provable_reason_codes");
  requireStringArray(codes, "non_provable_reason_codes");

  std::set<std::string> expected;
  for (auto reason : domain::kAllNonProvableReasons) {
    expected.insert(domain::nonProvableReasonToString(reason));
  }
  std::set<std::string> actual;
  for (const auto& code : codes) {
    actual.insert(code.get<std::string>());
  }
  if (actual != expected || codes.size() != expected.size()) {
    throw PolicyDocumentError(
        "non_provable_reason_codes must list exactly the eight reason codes");
  }
}

// -----------------------------------------------------------------------------
// validateSourcePrecedence
// -----------------------------------------------------------------------------
void validateSourcePrecedence(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw PolicyDocumentError("source precedence must be a JSON object");
  }

  const auto& version = requireMember(document, "version", "version");
  if (!version.is_string() || version.get<std::string>().empty()) {
    throw PolicyDocumentError("version must be a non-empty string");
  }

  const auto& venues = requireMember(document, "venues", "venues");
  if (!venues.is_object()) {
    throw PolicyDocumentError("venues must be an object");
  }

  for (auto it = venues.begin(); it != venues.end(); ++it) {
    if (!domain::parseVenue(it.key())) {
      throw PolicyDocumentError("unknown venue in source precedence: " +
                                it.key());
    }
  }

  for (auto venue : domain::kAllVenues) {
    const std::string slug = domain::venueToString(venue);
    const auto& entry = requireMember(venues, slug, "venues." + slug);
    for (const char* list : {"order_placed_sources_preferred",
                             "trade_executed_sources_preferred"}) {
      const std::string field = "venues." + slug + "." + list;
      requireStringArray(requireMember(entry, list, field), field);
    }
  }
}

nlohmann::json defaultClaimTaxonomy() {
  nlohmann::json document = nlohmann::json::object();
  document["claim_types"]["ORDER_PLACED"]["required_evidence_tags_all"] =
      nlohmann::json::array({"order_identity", "submission_timestamp",
                             "venue_acceptance_artifact"});
  document["claim_types"]["TRADE_EXECUTED"]["required_evidence_tags_all"] =
      nlohmann::json::array({"order_identity", "execution_identity",
                             "execution_timestamp", "execution_artifact"});

  document["non_provable_reason_codes"] = nlohmann::json::array();
  for (auto reason : domain::kAllNonProvableReasons) {
    document["non_provable_reason_codes"].push_back(
        domain::nonProvableReasonToString(reason));
  }
  return document;
}

nlohmann::json defaultSourcePrecedence() {
  nlohmann::json document = nlohmann::json::object();
  document["version"] = "source-precedence-v0.1.0";
  document["venues"]["hyperliquid"] =
      venuePreference({"venue_signed_attestation", "canonical_chain_state"},
                      {"venue_signed_attestation", "canonical_chain_state"});
  document["venues"]["base"] =
      venuePreference({"canonical_chain_state", "indexer_confirmed"},
                      {"canonical_chain_state", "indexer_confirmed"});
  document["venues"]["solana"] =
      venuePreference({"canonical_chain_state", "indexer_confirmed"},
                      {"canonical_chain_state", "indexer_confirmed"});
  document["venues"]["polymarket"] =
      venuePreference({"canonical_chain_state", "indexer_confirmed"},
                      {"canonical_chain_state", "indexer_confirmed"});
  return document;
}

}  // namespace policy
}  // namespace zkr
