#include "zkr/adapter/synthetic_venue_adapter.hpp"

#include "zkr/integrity/hashing.hpp"
#include "zkr/time/time_utils.hpp"

#include <stdexcept>
#include <utility>

namespace zkr {
namespace adapter {

namespace {

bool payloadFlag(const nlohmann::json& payload, const char* key) {
  if (!payload.is_object()) {
    return false;
  }
  auto it = payload.find(key);
  return it != payload.end() && it->is_boolean() && it->get<bool>();
}

const char* acceptanceSourceKind(domain::Venue venue) {
  switch (venue) {
    case domain::Venue::Hyperliquid:
      return "venue_signed_attestation";
    case domain::Venue::Base:
    case domain::Venue::Solana:
    case domain::Venue::Polymarket:
      return "canonical_chain_state";
  }
  return "canonical_chain_state";
}

}  // namespace

SyntheticVenueAdapter::SyntheticVenueAdapter(domain::Venue venue,
                                             const ITimeProvider& clock)
    : venue_(venue), clock_(clock) {}

domain::ExecutionAck SyntheticVenueAdapter::acknowledge(
    const domain::ProofRequest& request) {
  if (payloadFlag(request.payload, "simulate_ack_failure")) {
    throw std::runtime_error(std::string("venue ") +
                             domain::venueToString(venue_) +
                             " did not acknowledge order " + request.order_ref);
  }

  const std::string slug = domain::venueToString(venue_);

  domain::ExecutionAck ack;
  ack.accepted = true;
  ack.venue_order_ref = request.order_ref;
  ack.accepted_at = now_rfc3339(clock_);
  ack.acceptance_artifact_ref = slug + "://ack/" + request.order_ref;
  ack.acceptance_artifact_hash = integrity::hashJson({
      {"venue", slug},
      {"order_ref", request.order_ref},
      {"accepted_at", ack.accepted_at},
      {"kind", "acknowledgement"},
  });
  return ack;
}

// -----------------------------------------------------------------------------
// collectEvidence(request, ack)
// -----------------------------------------------------------------------------
domain::EvidenceBundle SyntheticVenueAdapter::collectEvidence(
    const domain::ProofRequest& request, const domain::ExecutionAck& ack) {
  if (payloadFlag(request.payload, "simulate_evidence_failure")) {
    throw std::runtime_error(std::string("evidence source for venue ") +
                             domain::venueToString(venue_) + " is unavailable");
  }

  const std::string slug = domain::venueToString(venue_);

  domain::EvidenceBundle bundle;
  bundle.observed_tags = {"order_identity", "submission_timestamp",
                          "venue_acceptance_artifact"};

  if (payloadFlag(request.payload, "simulate_conflict")) {
    bundle.conflicts.push_back("source_value_mismatch");
  }

  domain::EvidenceItem primary;
  primary.source_id = slug + "-primary";
  primary.source_kind = acceptanceSourceKind(venue_);
  primary.artifact_ref = ack.acceptance_artifact_ref;
  primary.artifact_hash = ack.acceptance_artifact_hash;
  primary.observed_at = ack.accepted_at;
  primary.tags = {"order_identity", "submission_timestamp",
                  "venue_acceptance_artifact"};
  bundle.items.push_back(std::move(primary));

  domain::EvidenceItem api;
  api.source_id = slug + "-api";
  api.source_kind = "venue_api_unsigned";
  api.artifact_ref = slug + "://api/order/" + request.order_ref;
  api.artifact_hash = integrity::hashJson({
      {"venue", slug},
      {"api_order_ref", request.order_ref},
  });
  api.observed_at = now_rfc3339(clock_);
  api.tags = {"order_identity", "submission_timestamp"};
  bundle.items.push_back(std::move(api));

  if (request.claim_type == domain::ClaimType::TradeExecuted &&
      request.execution_ref) {
    const std::string& execution_ref = *request.execution_ref;
    bundle.observed_tags.insert("execution_identity");
    bundle.observed_tags.insert("execution_timestamp");
    bundle.observed_tags.insert("execution_artifact");

    domain::EvidenceItem execution;
    execution.source_id = slug + "-execution";
    execution.source_kind = acceptanceSourceKind(venue_);
    execution.artifact_ref = slug + "://execution/" + execution_ref;
    execution.artifact_hash = integrity::hashJson({
        {"venue", slug},
        {"order_ref", request.order_ref},
        {"execution_ref", execution_ref},
    });
    execution.observed_at = now_rfc3339(clock_);
    execution.tags = {"execution_identity", "execution_timestamp",
                      "execution_artifact"};
    bundle.items.push_back(std::move(execution));

    bundle.finality_observed_at = now_rfc3339(clock_);
  }

  if (request.payload.is_object()) {
    auto missing = request.payload.find("missing_tags");
    if (missing != request.payload.end() && missing->is_array()) {
      for (const auto& tag : *missing) {
        if (tag.is_string()) {
          bundle.observed_tags.erase(tag.get<std::string>());
        }
      }
    }
  }

  return bundle;
}

}  // namespace adapter
}  // namespace zkr
