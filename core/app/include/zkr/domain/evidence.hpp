#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace zkr {
namespace domain {

// -----------------------------------------------------------------------------
// EvidenceItem
// -----------------------------------------------------------------------------
// Responsibility: One observed artifact supporting a claim.
//
// source_kind classifies where the artifact came from
// ("canonical_chain_state", "venue_signed_attestation",
// "venue_api_unsigned", ...). The policy engine matches it against the
// venue's preferred-source list.
//
// tags name the semantic facts this artifact establishes
// ("order_identity", "execution_artifact", ...).
// -----------------------------------------------------------------------------
struct EvidenceItem {
  std::string source_id;
  std::string source_kind;
  std::string artifact_ref;
  std::string artifact_hash;
  std::string observed_at;
  std::vector<std::string> tags;
};

// -----------------------------------------------------------------------------
// EvidenceBundle
// -----------------------------------------------------------------------------
//
// @brief  Everything an adapter collected for one request.
//
// @details
// observed_tags is the set of tags the adapter vouches for across all items.
// It is tracked separately from the per-item tags because an adapter may
// withdraw a tag (e.g. when a cross-check fails) without dropping the item.
//
// conflicts lists identifiers of detected inconsistencies between sources.
// Any entry makes the bundle unacceptable to the policy engine.
//
// The bundle is a value: the engine owns the copy it passes to the policy
// engine and later folds the items into the receipt's provenance.
// -----------------------------------------------------------------------------
struct EvidenceBundle {
  std::vector<EvidenceItem> items;
  std::set<std::string> observed_tags;
  std::vector<std::string> conflicts;
  std::optional<std::string> finality_observed_at;

  // -------------------------------------------------------------------------
  // evidenceRoot()
  // -------------------------------------------------------------------------
  // @brief  Hash binding the set of artifact hashes in this bundle.
  //
  // @return hash_json({"leaves": sorted artifact hashes}).
  //
  // @details
  // The leaves are sorted before hashing, so two bundles with the same
  // multiset of artifact hashes have the same root regardless of collection
  // order.
  // -------------------------------------------------------------------------
  std::string evidenceRoot() const;
};

}  // namespace domain
}  // namespace zkr
