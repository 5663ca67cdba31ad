#pragma once

#include "zkr/time/i_time_provider.hpp"

namespace zkr {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the zk_receipts executable so receipts carry the actual time they
// were created and finalized.
//
// Thread model:
//   std::chrono::system_clock::now() is safe to call from any thread.
//   No internal mutex is needed.
//
// Ownership:
//   Created in main() and passed by const reference to ReceiptEngine and
//   the adapters. main() owns the instance; components borrow it.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace zkr
