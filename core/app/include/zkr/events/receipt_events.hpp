#pragma once

#include "zkr/domain/receipt.hpp"
#include "zkr/domain/receipt_status.hpp"
#include "zkr/domain/venue.hpp"

#include <cstdint>
#include <string>

namespace zkr {

// -----------------------------------------------------------------------------
// ReceiptSubmittedEvent
// -----------------------------------------------------------------------------
// Published by ReceiptEngine::submit() on the caller's thread, right after
// the PENDING receipt is stored and before the pipeline task is scheduled.
// -----------------------------------------------------------------------------
struct ReceiptSubmittedEvent {
  domain::ReceiptId receipt_id;
  domain::Venue venue{domain::Venue::Hyperliquid};
  domain::ClaimType claim_type{domain::ClaimType::OrderPlaced};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// ReceiptFinalizedEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries the terminal snapshot of a receipt once its
// pipeline has finished (PROVED or NON_PROVABLE).
// Thread model: Published on a WorkerPool thread. ReceiptServer forwards it
// to its PUB socket through a ThreadSafeQueue; the snapshot is a copy and is
// never mutated after publication.
// -----------------------------------------------------------------------------
struct ReceiptFinalizedEvent {
  domain::ZKReceipt receipt;
  std::int64_t timestamp_ms{0};
};

}  // namespace zkr
