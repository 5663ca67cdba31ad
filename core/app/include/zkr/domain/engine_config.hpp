#pragma once

#include <cstddef>
#include <string>

namespace zkr {
namespace domain {

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
// Responsibility: Engine-wide settings, fixed for the lifetime of a
// ReceiptEngine.
//
// Thread-safety: Copied into the engine at construction and only read
// afterwards.
// -----------------------------------------------------------------------------
struct EngineConfig {
  // Identity recorded in Integrity::signer and mixed into the signature.
  std::string signer{"zkputer-dev-signer"};

  // Schema version stamped on every receipt and bound by the schema hash.
  std::string receipt_version{"v0.1.0"};

  // Number of pool threads running receipt pipelines. Must be at least 1.
  std::size_t worker_threads{4};
};

}  // namespace domain
}  // namespace zkr
