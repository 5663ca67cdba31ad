#pragma once

#include <cstdint>

namespace zkr {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Receipts carry several timestamps (created_at, updated_at,
// execution_observed_at, the adapter's accepted_at / observed_at). If every
// component read the system clock directly, tests could not pin those
// values and receipts would differ from run to run.
//
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the caller.
//
// Components receive `const ITimeProvider&` and call now_ms() whenever they
// need a timestamp. time_utils.hpp renders the value as RFC 3339 text.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//   Pipeline workers read the clock concurrently.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch
  //         (1970-01-01 00:00:00 UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace zkr
