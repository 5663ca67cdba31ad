#pragma once

#include "zkr/time/i_time_provider.hpp"

#include <cstdint>
#include <string>

namespace zkr {

// -----------------------------------------------------------------------------
// Time formatting utilities
// -----------------------------------------------------------------------------
//
// @brief  Convert the engine's epoch-millisecond clock values into the
//         RFC 3339 text stored in receipts.
//
// @details
// Format: "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC, millisecond precision, literal Z).
// Negative inputs (before 1970) are clamped to the epoch.
//
// Thread-safety: Stateless: safe to call from any thread (uses gmtime_r).
// -----------------------------------------------------------------------------
std::string format_rfc3339_ms(std::int64_t epoch_ms);

// -------------------------------------------------------------------------
// now_rfc3339(clock)
// -------------------------------------------------------------------------
// @brief  format_rfc3339_ms(clock.now_ms()).
// -------------------------------------------------------------------------
inline std::string now_rfc3339(const ITimeProvider& clock) {
  return format_rfc3339_ms(clock.now_ms());
}

}  // namespace zkr
