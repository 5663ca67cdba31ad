#pragma once

#include "zkr/domain/receipt.hpp"

namespace zkr {
namespace verifier {

// -----------------------------------------------------------------------------
// IReceiptVerifier
// -----------------------------------------------------------------------------
// Consistency check run by ReceiptEngine on every freshly assembled PROVED
// receipt. A false result downgrades the receipt to NON_PROVABLE /
// PROOF_FAILURE. Implementations must be pure and thread-safe.
// -----------------------------------------------------------------------------
class IReceiptVerifier {
 public:
  virtual ~IReceiptVerifier() = default;

  virtual bool verify(const domain::ZKReceipt& receipt) const = 0;
};

}  // namespace verifier
}  // namespace zkr
