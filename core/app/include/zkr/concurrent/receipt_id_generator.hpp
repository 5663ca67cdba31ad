#pragma once

#include "zkr/domain/receipt.hpp"

namespace zkr {

// -----------------------------------------------------------------------------
// ReceiptIdGenerator: random UUID v4 receipt identifiers
// -----------------------------------------------------------------------------
//
// @brief  Produces RFC 4122 version-4 UUID strings
//         ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx", lowercase hex) from the
//         OpenSSL CSPRNG (RAND_bytes).
//
// @details
// Receipt ids are handed to external callers, so they are random rather than
// a counter: they must not reveal submission order or volume. Uniqueness is
// probabilistic; ReceiptEngine additionally redraws when an id is already in
// its store.
//
// Thread model:
//   next_id() is safe to call concurrently from any number of threads.
//   RAND_bytes is thread-safe in OpenSSL 1.1.0 and later.
//
// Ownership:
//   Owned by ReceiptEngine as a value member.
// -----------------------------------------------------------------------------
class ReceiptIdGenerator {
 public:
  ReceiptIdGenerator() = default;

  ReceiptIdGenerator(const ReceiptIdGenerator&) = delete;
  ReceiptIdGenerator& operator=(const ReceiptIdGenerator&) = delete;
  ReceiptIdGenerator(ReceiptIdGenerator&&) = delete;
  ReceiptIdGenerator& operator=(ReceiptIdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @brief  Returns a fresh UUID v4 string.
  //
  // @throws std::runtime_error if the CSPRNG cannot produce bytes.
  // -------------------------------------------------------------------------
  domain::ReceiptId next_id() const;
};

}  // namespace zkr
