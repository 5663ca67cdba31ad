#include "zkr/policy/policy_engine.hpp"

#include "zkr/policy/policy_documents.hpp"

#include <algorithm>

namespace zkr {
namespace policy {

namespace {

const std::vector<std::string> kNoEntries;

std::string join(const std::vector<std::string>& values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += values[i];
  }
  return out;
}

const char* preferenceListKey(domain::ClaimType claim_type) {
  switch (claim_type) {
    case domain::ClaimType::OrderPlaced:
      return "order_placed_sources_preferred";
    case domain::ClaimType::TradeExecuted:
      return "trade_executed_sources_preferred";
  }
  return "order_placed_sources_preferred";
}

constexpr domain::ClaimType kAllClaimTypes[] = {domain::ClaimType::OrderPlaced,
                                                domain::ClaimType::TradeExecuted};

}  // namespace

PolicyEngine::PolicyEngine(const nlohmann::json& claim_taxonomy,
                           const nlohmann::json& source_precedence) {
  validateClaimTaxonomy(claim_taxonomy);
  validateSourcePrecedence(source_precedence);

  for (auto claim_type : kAllClaimTypes) {
    required_tags_[claim_type] =
        claim_taxonomy.at("claim_types")
            .at(domain::claimTypeToString(claim_type))
            .at("required_evidence_tags_all")
            .get<std::vector<std::string>>();
  }

  const auto& venues = source_precedence.at("venues");
  for (auto venue : domain::kAllVenues) {
    const auto& entry = venues.at(domain::venueToString(venue));
    for (auto claim_type : kAllClaimTypes) {
      preferred_sources_[{venue, claim_type}] =
          entry.at(preferenceListKey(claim_type)).get<std::vector<std::string>>();
    }
  }

  source_precedence_version_ = source_precedence.at("version").get<std::string>();
}

PolicyEngine PolicyEngine::withDefaults() {
  return PolicyEngine(defaultClaimTaxonomy(), defaultSourcePrecedence());
}

PolicyEngine PolicyEngine::fromDirectory(const std::string& directory) {
  return PolicyEngine(loadPolicyDocument(directory + "/claim-taxonomy.json"),
                      loadPolicyDocument(directory + "/source-precedence.json"));
}

const std::vector<std::string>& PolicyEngine::requiredTags(
    domain::ClaimType claim_type) const {
  auto it = required_tags_.find(claim_type);
  return it == required_tags_.end() ? kNoEntries : it->second;
}

const std::vector<std::string>& PolicyEngine::preferredSources(
    domain::Venue venue, domain::ClaimType claim_type) const {
  auto it = preferred_sources_.find({venue, claim_type});
  return it == preferred_sources_.end() ? kNoEntries : it->second;
}

// -----------------------------------------------------------------------------
// evaluate(venue, claim_type, bundle)
// -----------------------------------------------------------------------------
PolicyDecision PolicyEngine::evaluate(domain::Venue venue,
                                      domain::ClaimType claim_type,
                                      const domain::EvidenceBundle& bundle) const {
  if (!bundle.conflicts.empty()) {
    return {false, domain::NonProvableReason::EvidenceConflict,
            "Conflicting evidence entries detected: " + join(bundle.conflicts)};
  }

  if (bundle.items.empty()) {
    return {false, domain::NonProvableReason::EvidenceMissing,
            "No evidence artifacts were collected."};
  }

  std::vector<std::string> missing_tags;
  for (const auto& tag : requiredTags(claim_type)) {
    if (bundle.observed_tags.count(tag) == 0) {
      missing_tags.push_back(tag);
    }
  }
  if (!missing_tags.empty()) {
    return {false, domain::NonProvableReason::EvidenceMissing,
            "Missing required evidence tags: " + join(missing_tags)};
  }

  const auto& preferred = preferredSources(venue, claim_type);
  const bool preferred_observed = std::any_of(
      bundle.items.begin(), bundle.items.end(),
      [&preferred](const domain::EvidenceItem& item) {
        return std::find(preferred.begin(), preferred.end(), item.source_kind) !=
               preferred.end();
      });
  if (!preferred.empty() && !preferred_observed) {
    return {false, domain::NonProvableReason::SourceUnavailable,
            "No acceptable preferred source kinds observed. Expected one of: " +
                join(preferred)};
  }

  return {true, std::nullopt, {}};
}

}  // namespace policy
}  // namespace zkr
