#pragma once

#include "zkr/domain/venue.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace zkr {
namespace domain {

// -----------------------------------------------------------------------------
// ProofRequest
// -----------------------------------------------------------------------------
// Responsibility: Immutable input to ReceiptEngine::submit(). Identifies the
// venue, the kind of claim and the account/order (and optionally execution)
// it is about.
//
// payload is opaque to the engine. Adapters may read it; the synthetic
// adapter uses it to simulate conflicts, missing tags and stage failures.
// -----------------------------------------------------------------------------
struct ProofRequest {
  Venue venue{Venue::Hyperliquid};
  ClaimType claim_type{ClaimType::OrderPlaced};
  std::string account_ref;
  std::string order_ref;
  std::optional<std::string> execution_ref;
  nlohmann::json payload = nlohmann::json::object();
};

// -----------------------------------------------------------------------------
// ExecutionAck
// -----------------------------------------------------------------------------
// Responsibility: The venue's acknowledgement of an order, produced once per
// request by IVenueAdapter::acknowledge() and handed back to the adapter for
// evidence collection and statement synthesis.
// -----------------------------------------------------------------------------
struct ExecutionAck {
  bool accepted{false};
  std::string venue_order_ref;
  std::string acceptance_artifact_ref;
  std::string acceptance_artifact_hash;
  std::string accepted_at;  // RFC 3339 UTC, millisecond precision
};

}  // namespace domain
}  // namespace zkr
