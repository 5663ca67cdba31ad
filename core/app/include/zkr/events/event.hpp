#pragma once

#include "zkr/events/receipt_events.hpp"

#include <variant>

namespace zkr {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type carried by the EventBus. Adding a
// lifecycle event means adding it here; std::visit sites then fail to compile
// until they handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<ReceiptSubmittedEvent, ReceiptFinalizedEvent>;

}  // namespace zkr
