#pragma once

#include "zkr/domain/evidence.hpp"
#include "zkr/domain/receipt_status.hpp"
#include "zkr/domain/venue.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zkr {
namespace policy {

// -----------------------------------------------------------------------------
// PolicyDecision
// -----------------------------------------------------------------------------
// Result of PolicyEngine::evaluate(). When ok is false, reason is set and
// details carries a human-readable explanation that ends up in the
// receipt's non_provable block.
// -----------------------------------------------------------------------------
struct PolicyDecision {
  bool ok{false};
  std::optional<domain::NonProvableReason> reason;
  std::string details;
};

// -----------------------------------------------------------------------------
// PolicyEngine
// -----------------------------------------------------------------------------
//
// @brief  Decides whether an evidence bundle is sufficient and trustworthy
//         for a (venue, claim type) pair.
//
// @details
// Constructed once from the claim taxonomy and source precedence documents
// (see policy_documents.hpp). Both are validated and parsed into typed
// tables in the constructor; evaluation never looks at JSON again.
//
// evaluate() checks, in order, stopping at the first failure:
//   1. conflicts present        → EVIDENCE_CONFLICT
//   2. no evidence items        → EVIDENCE_MISSING
//   3. required tags not all in observed_tags → EVIDENCE_MISSING
//   4. a non-empty preferred-source list and no item of a preferred
//      source kind             → SOURCE_UNAVAILABLE
//   5. otherwise accept.
//
// Thread model: Immutable after construction; evaluate() is const and
// safe to call from any number of pipeline workers concurrently.
// -----------------------------------------------------------------------------
class PolicyEngine {
 public:
  // -------------------------------------------------------------------------
  // PolicyEngine(claim_taxonomy, source_precedence)
  // -------------------------------------------------------------------------
  // @throws PolicyDocumentError if either document fails validation.
  // -------------------------------------------------------------------------
  PolicyEngine(const nlohmann::json& claim_taxonomy,
               const nlohmann::json& source_precedence);

  // Engine over the built-in default documents.
  static PolicyEngine withDefaults();

  // Loads claim-taxonomy.json and source-precedence.json from directory.
  static PolicyEngine fromDirectory(const std::string& directory);

  PolicyDecision evaluate(domain::Venue venue, domain::ClaimType claim_type,
                          const domain::EvidenceBundle& bundle) const;

  std::string policyId() const { return "default-v0.1.0"; }
  std::string finalityRuleId() const { return "venue-default-finality-v0.1.0"; }
  const std::string& sourcePrecedenceVersion() const {
    return source_precedence_version_;
  }

  const std::vector<std::string>& requiredTags(domain::ClaimType claim_type) const;
  const std::vector<std::string>& preferredSources(domain::Venue venue,
                                                   domain::ClaimType claim_type) const;

 private:
  std::map<domain::ClaimType, std::vector<std::string>> required_tags_;
  std::map<std::pair<domain::Venue, domain::ClaimType>, std::vector<std::string>>
      preferred_sources_;
  std::string source_precedence_version_;
};

}  // namespace policy
}  // namespace zkr
