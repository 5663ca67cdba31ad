#pragma once

#include "zkr/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace zkr {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly with
//         advance_time() rather than read from the system clock.
//
// @details
// Tests use it to make every timestamp in a receipt predictable, which in
// turn makes every hash that covers a timestamp (acknowledgement artifact
// hashes, and through them the evidence root) reproducible across runs.
//
// Internal storage is a std::atomic<int64_t>: pipeline workers read the
// clock while the test thread may advance it.
//
// Thread model:
//   - advance_time() may be called from any thread.
//   - now_ms() may be called concurrently from any number of threads.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at the given epoch milliseconds (0 by default).
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  // -------------------------------------------------------------------------
  // now_ms() override
  // -------------------------------------------------------------------------
  // @brief  Returns the last time set by advance_time() (or the start value).
  //
  // Thread-safety: Safe to call from any thread. Lock-free on 64-bit
  //                platforms.
  // -------------------------------------------------------------------------
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given timestamp.
  //
  // @details
  // Monotonicity is not enforced; tests may set arbitrary times.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace zkr
