#include "zkr/time/live_time_provider.hpp"

#include <chrono>

namespace zkr {

// -----------------------------------------------------------------------------
// now_ms(): delegate to system_clock and convert to epoch milliseconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ms() const {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch)
      .count();
}

}  // namespace zkr
