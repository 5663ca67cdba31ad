#include "zkr/domain/evidence.hpp"
#include "zkr/integrity/hashing.hpp"

#include <algorithm>

namespace zkr {
namespace domain {

// -----------------------------------------------------------------------------
// evidenceRoot(): hash over the sorted artifact hashes
// -----------------------------------------------------------------------------
std::string EvidenceBundle::evidenceRoot() const {
  std::vector<std::string> leaves;
  leaves.reserve(items.size());
  for (const auto& item : items) {
    leaves.push_back(item.artifact_hash);
  }
  // Sorting makes the root independent of collection order.
  std::sort(leaves.begin(), leaves.end());
  return integrity::hashJson({{"leaves", leaves}});
}

}  // namespace domain
}  // namespace zkr
