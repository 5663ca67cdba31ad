#pragma once

#include "zkr/adapter/i_venue_adapter.hpp"
#include "zkr/concurrent/receipt_id_generator.hpp"
#include "zkr/concurrent/worker_pool.hpp"
#include "zkr/domain/engine_config.hpp"
#include "zkr/domain/proof_request.hpp"
#include "zkr/domain/receipt.hpp"
#include "zkr/eventbus/event_bus.hpp"
#include "zkr/policy/policy_engine.hpp"
#include "zkr/prover/i_prover.hpp"
#include "zkr/time/i_time_provider.hpp"
#include "zkr/verifier/i_receipt_verifier.hpp"

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace zkr {

// -----------------------------------------------------------------------------
// Caller-facing errors
// -----------------------------------------------------------------------------
// Business outcomes (missing evidence, unsupported venue, proof failure...)
// are never errors: they are NON_PROVABLE receipts. These exceptions cover
// only what a caller of submit() or wait_for_receipt() can get instead of a
// receipt.
// -----------------------------------------------------------------------------
class ReceiptEngineError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class UnknownReceiptError : public ReceiptEngineError {
 public:
  explicit UnknownReceiptError(const domain::ReceiptId& receipt_id)
      : ReceiptEngineError("unknown receipt id: " + receipt_id) {}
};

class ReceiptWaitTimeout : public ReceiptEngineError {
 public:
  explicit ReceiptWaitTimeout(const domain::ReceiptId& receipt_id)
      : ReceiptEngineError("timeout waiting for receipt " + receipt_id) {}
};

// The request cannot be hashed into a PENDING receipt (e.g. a reference
// that is not valid UTF-8).
class InvalidRequestError : public ReceiptEngineError {
 public:
  explicit InvalidRequestError(const std::string& cause)
      : ReceiptEngineError("invalid proof request: " + cause) {}
};

class EngineStoppedError : public ReceiptEngineError {
 public:
  EngineStoppedError()
      : ReceiptEngineError("ReceiptEngine is stopped; submission rejected") {}
};

// -----------------------------------------------------------------------------
// ReceiptEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns the receipt store and drives every submitted request through
//         adapter → policy → prover → verifier to a terminal receipt.
//
// @details
// submit() stores a PENDING receipt and schedules one pipeline task on the
// WorkerPool. The task performs, in order, stopping at the first failure:
//
//   1. adapter lookup          none        → UNSUPPORTED_VENUE_CLAIM
//   2. acknowledge()           throws      → SOURCE_UNAVAILABLE
//   3. collectEvidence()       throws      → SOURCE_UNAVAILABLE
//   4. policy evaluate()       rejects     → reason from the policy
//   5. buildStatement()        throws/""   → POLICY_VIOLATION
//      claim hash              throws      → POLICY_VIOLATION
//   6. prove(public inputs)    throws      → PROOF_FAILURE
//      backend mismatch                    → PROOF_FAILURE
//   7. assemble PROVED receipt throws      → PROOF_FAILURE
//   8. verify()                false       → PROOF_FAILURE (downgrade)
//                              throws      → PROOF_FAILURE
//   9. store the terminal receipt, publish ReceiptFinalizedEvent
//
// An evidence root that cannot be computed counts as a step 3 failure.
// Every NON_PROVABLE write restores placeholder proof metadata, sets
// timing.updated_at and recomputes the whole integrity block. If the task
// faults while the receipt is still PENDING, it is finalized NON_PROVABLE
// (POLICY_VIOLATION, "Pipeline fault: ...") before the fault is rethrown.
//
// Completion signalling:
//   Each id maps to the std::shared_future<void> of its task. The entry is
//   kept after completion so that any number of waiters, early or late,
//   observe the same outcome; an exception escaping the task (a fault, not
//   a business outcome) is rethrown to every waiter.
//
// Thread layout:
//
//   caller threads    → submit(), get_receipt(), wait_for_receipt()
//   WorkerPool (N)    → one pipeline task per submitted request
//
// Ownership:
//   ReceiptEngine
//    ├── clock_          (const ITimeProvider&, non-owning, outlives engine)
//    ├── config_         (EngineConfig, value member)
//    ├── policy_         (PolicyEngine, value member, immutable)
//    ├── adapters_       (Venue → shared_ptr<IVenueAdapter>)
//    ├── prover_         (shared_ptr<IProver>)
//    ├── verifier_       (shared_ptr<IReceiptVerifier>)
//    ├── id_gen_         (ReceiptIdGenerator)
//    ├── event_bus_      (EventBus)
//    ├── store_ / tasks_ (each behind its own mutex)
//    └── pool_           (WorkerPool, declared last, destroyed first)
// -----------------------------------------------------------------------------
class ReceiptEngine {
 public:
  using AdapterList = std::vector<std::shared_ptr<adapter::IVenueAdapter>>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  adapters  One adapter per supported venue. The registry is keyed
  //                   by adapter->venue(); a later adapter for the same
  //                   venue replaces an earlier one. Venues without an
  //                   adapter finish as UNSUPPORTED_VENUE_CLAIM.
  // @param  clock     Source of every receipt timestamp. Must outlive the
  //                   engine.
  //
  // @throws std::invalid_argument if an adapter, the prover or the verifier
  //         is null.
  //
  // @details
  // No threads are spawned in the constructor. Requests submitted before
  // start() are queued and run once the pool starts.
  // -------------------------------------------------------------------------
  ReceiptEngine(const AdapterList& adapters, policy::PolicyEngine policy,
                std::shared_ptr<prover::IProver> prover,
                std::shared_ptr<verifier::IReceiptVerifier> verifier,
                const ITimeProvider& clock, domain::EngineConfig config = {});

  // Destructor calls stop() for RAII safety.
  ~ReceiptEngine();

  ReceiptEngine(const ReceiptEngine&) = delete;
  ReceiptEngine& operator=(const ReceiptEngine&) = delete;
  ReceiptEngine(ReceiptEngine&&) = delete;
  ReceiptEngine& operator=(ReceiptEngine&&) = delete;

  // Spawns the worker pool and accepts submissions again after a stop().
  // Idempotent. Call from one thread only.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Drains every queued pipeline, then joins the workers.
  //
  // @details
  // Pipelines already scheduled still run to completion, so every receipt
  // submitted before stop() reaches a terminal status. From then on submit()
  // throws EngineStoppedError until start() is called again. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // submit(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Creates a PENDING receipt and schedules its pipeline.
  //
  // @return The new receipt id. The receipt is readable through
  //         get_receipt() before submit() returns.
  //
  // @throws InvalidRequestError  a reference is not valid UTF-8.
  // @throws EngineStoppedError   stop() was called and start() was not
  //                              called again.
  // @throws (subscriber error)   a ReceiptSubmittedEvent subscriber threw.
  //                              The receipt is discarded unscheduled.
  //
  // @details
  // The PENDING receipt carries the pending claim hash, the empty evidence
  // root, placeholder proof metadata and integrity over that state.
  //
  // Thread-safety: Safe from any thread. Never calls an adapter, the prover
  //                or the verifier.
  // Side-effects:  Publishes ReceiptSubmittedEvent on the calling thread,
  //                before the pipeline is scheduled.
  // -------------------------------------------------------------------------
  domain::ReceiptId submit(const domain::ProofRequest& request);

  // Snapshot of the receipt, or std::nullopt for an unknown id. Never
  // blocks on a running pipeline.
  std::optional<domain::ZKReceipt> get_receipt(const domain::ReceiptId& receipt_id) const;

  // -------------------------------------------------------------------------
  // wait_for_receipt(receipt_id, timeout)
  // -------------------------------------------------------------------------
  //
  // @brief  Blocks until the receipt's pipeline has finished, then returns
  //         its snapshot.
  //
  // @throws UnknownReceiptError  no receipt with this id.
  // @throws ReceiptWaitTimeout   pipeline still running after timeout. The
  //                              pipeline keeps running and still writes
  //                              its result.
  // @throws (pipeline fault)     rethrown as-is when the task itself failed.
  //
  // Thread-safety: Any number of threads may wait on the same id.
  // -------------------------------------------------------------------------
  domain::ZKReceipt wait_for_receipt(const domain::ReceiptId& receipt_id,
                                     std::chrono::milliseconds timeout);

  // Lifecycle events (ReceiptSubmittedEvent, ReceiptFinalizedEvent).
  EventBus& eventBus() { return event_bus_; }

  const domain::EngineConfig& config() const { return config_; }

 private:
  domain::ZKReceipt newPendingReceipt(const domain::ProofRequest& request) const;

  void runPipeline(const domain::ReceiptId& receipt_id,
                   const domain::ProofRequest& request);

  domain::ZKReceipt markNonProvable(domain::ZKReceipt receipt,
                                    domain::NonProvableReason reason,
                                    std::string details) const;

  domain::ZKReceipt markProved(domain::ZKReceipt receipt, std::string claim_hash,
                               std::string statement, std::string evidence_root,
                               domain::EvidenceBundle bundle,
                               domain::ProofMetadata proof) const;

  // Stores the terminal receipt and publishes ReceiptFinalizedEvent.
  void finalize(domain::ZKReceipt receipt);

  void discardPending(const domain::ReceiptId& receipt_id);
  void abandonPipeline(const domain::ReceiptId& receipt_id,
                       const std::string& cause);

  const ITimeProvider& clock_;
  domain::EngineConfig config_;
  policy::PolicyEngine policy_;
  std::map<domain::Venue, std::shared_ptr<adapter::IVenueAdapter>> adapters_;
  std::shared_ptr<prover::IProver> prover_;
  std::shared_ptr<verifier::IReceiptVerifier> verifier_;

  ReceiptIdGenerator id_gen_;
  EventBus event_bus_;

  mutable std::mutex store_mutex_;
  std::unordered_map<domain::ReceiptId, domain::ZKReceipt> store_;

  mutable std::mutex tasks_mutex_;
  std::unordered_map<domain::ReceiptId, std::shared_future<void>> tasks_;
  bool accepting_{true};  // guarded by tasks_mutex_

  bool running_{false};

  // Last member: destroyed (and joined) before anything its tasks touch.
  WorkerPool pool_;
};

}  // namespace zkr
