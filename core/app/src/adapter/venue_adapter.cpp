#include "zkr/adapter/i_venue_adapter.hpp"

namespace zkr {
namespace adapter {

std::string IVenueAdapter::buildStatement(const domain::ProofRequest& request,
                                          const domain::ExecutionAck& ack,
                                          const domain::EvidenceBundle& /*bundle*/) {
  const std::string prefix = "Order " + request.order_ref + " for account " +
                             request.account_ref;
  const std::string venue = domain::venueToString(request.venue);

  if (request.claim_type == domain::ClaimType::OrderPlaced) {
    return prefix + " was accepted on venue " + venue + " at " +
           ack.accepted_at + ".";
  }
  return prefix + " was executed on venue " + venue + " with execution ref " +
         request.execution_ref.value_or("UNKNOWN") + ".";
}

}  // namespace adapter
}  // namespace zkr
