#include "zkr/engine/receipt_engine.hpp"

#include "zkr/integrity/hashing.hpp"
#include "zkr/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace zkr {

namespace {

constexpr const char* kPendingStatement =
    "PENDING: statement unavailable until evidence collection completes";

constexpr const char* kVerificationFailedDetails =
    "Offchain verification failed for produced proof metadata.";

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ReceiptEngine::ReceiptEngine(const AdapterList& adapters,
                             policy::PolicyEngine policy,
                             std::shared_ptr<prover::IProver> prover,
                             std::shared_ptr<verifier::IReceiptVerifier> verifier,
                             const ITimeProvider& clock,
                             domain::EngineConfig config)
    : clock_(clock),
      config_(std::move(config)),
      policy_(std::move(policy)),
      prover_(std::move(prover)),
      verifier_(std::move(verifier)),
      pool_(config_.worker_threads) {
  if (!prover_) {
    throw std::invalid_argument("ReceiptEngine requires a prover");
  }
  if (!verifier_) {
    throw std::invalid_argument("ReceiptEngine requires a verifier");
  }
  for (const auto& adapter : adapters) {
    if (!adapter) {
      throw std::invalid_argument("ReceiptEngine adapter list contains null");
    }
    adapters_[adapter->venue()] = adapter;
  }
}

ReceiptEngine::~ReceiptEngine() { stop(); }

void ReceiptEngine::start() {
  if (running_) {
    return;
  }

  {
    std::lock_guard lock(tasks_mutex_);
    accepting_ = true;
  }
  pool_.start();
  running_ = true;

  std::cout << "[ReceiptEngine] started. " << pool_.threadCount()
            << " worker thread(s), " << adapters_.size()
            << " venue adapter(s), prover backend "
            << domain::proofBackendToString(prover_->backend()) << ", policy "
            << policy_.policyId() << ".\n";
}

void ReceiptEngine::stop() {
  {
    std::lock_guard lock(tasks_mutex_);
    accepting_ = false;
  }
  if (!running_) {
    return;
  }

  pool_.stop();
  running_ = false;

  std::cout << "[ReceiptEngine] stopped. Pending pipelines drained.\n";
}

// -----------------------------------------------------------------------------
// submit(request)
// -----------------------------------------------------------------------------
domain::ReceiptId ReceiptEngine::submit(const domain::ProofRequest& request) {
  {
    std::lock_guard lock(tasks_mutex_);
    if (!accepting_) {
      throw EngineStoppedError();
    }
  }

  domain::ZKReceipt pending;
  try {
    pending = newPendingReceipt(request);
  } catch (const nlohmann::json::exception& e) {
    throw InvalidRequestError(e.what());
  }

  domain::ReceiptId receipt_id;
  {
    std::lock_guard lock(store_mutex_);
    do {
      receipt_id = id_gen_.next_id();
    } while (store_.count(receipt_id) != 0);

    pending.receipt_id = receipt_id;
    store_.emplace(receipt_id, std::move(pending));
  }

  // A failed submit leaves nothing behind: the caller never learns the id.
  try {
    event_bus_.publish(ReceiptSubmittedEvent{
        receipt_id, request.venue, request.claim_type, clock_.now_ms()});
  } catch (const std::exception&) {
    discardPending(receipt_id);
    throw;
  }

  // The handle is registered before the id is returned, so every caller
  // that knows the id can wait on it.
  std::lock_guard lock(tasks_mutex_);
  if (!accepting_) {
    discardPending(receipt_id);
    throw EngineStoppedError();
  }
  tasks_[receipt_id] = pool_.schedule([this, receipt_id, request] {
    try {
      runPipeline(receipt_id, request);
    } catch (const std::exception& e) {
      std::cerr << "[ReceiptEngine] pipeline fault for receipt " << receipt_id
                << ": " << e.what() << "\n";
      abandonPipeline(receipt_id, e.what());
      throw;
    } catch (...) {
      std::cerr << "[ReceiptEngine] pipeline fault for receipt " << receipt_id
                << ": non-standard exception\n";
      abandonPipeline(receipt_id, "non-standard exception");
      throw;
    }
  });

  return receipt_id;
}

void ReceiptEngine::discardPending(const domain::ReceiptId& receipt_id) {
  std::lock_guard lock(store_mutex_);
  store_.erase(receipt_id);
}

// -----------------------------------------------------------------------------
// abandonPipeline(receipt_id, cause)
// -----------------------------------------------------------------------------
// A pipeline that faulted before writing a terminal receipt still leaves one
// behind. A receipt that is already terminal is left untouched.
// -----------------------------------------------------------------------------
void ReceiptEngine::abandonPipeline(const domain::ReceiptId& receipt_id,
                                    const std::string& cause) {
  auto current = get_receipt(receipt_id);
  if (!current || domain::isTerminal(current->status)) {
    return;
  }

  try {
    finalize(markNonProvable(std::move(*current),
                             domain::NonProvableReason::PolicyViolation,
                             "Pipeline fault: " + cause));
  } catch (const std::exception& e) {
    std::cerr << "[ReceiptEngine] receipt " << receipt_id
              << " could not be finalized after a fault: " << e.what() << "\n";
  }
}

std::optional<domain::ZKReceipt> ReceiptEngine::get_receipt(
    const domain::ReceiptId& receipt_id) const {
  std::lock_guard lock(store_mutex_);
  auto it = store_.find(receipt_id);
  if (it == store_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// wait_for_receipt(receipt_id, timeout)
// -----------------------------------------------------------------------------
domain::ZKReceipt ReceiptEngine::wait_for_receipt(
    const domain::ReceiptId& receipt_id, std::chrono::milliseconds timeout) {
  std::shared_future<void> done;
  {
    std::lock_guard lock(tasks_mutex_);
    auto it = tasks_.find(receipt_id);
    if (it != tasks_.end()) {
      done = it->second;
    }
  }

  if (done.valid()) {
    if (done.wait_for(timeout) != std::future_status::ready) {
      throw ReceiptWaitTimeout(receipt_id);
    }
    done.get();  // rethrows a pipeline fault
  }

  auto receipt = get_receipt(receipt_id);
  if (!receipt) {
    throw UnknownReceiptError(receipt_id);
  }
  return *receipt;
}

// -----------------------------------------------------------------------------
// newPendingReceipt(request)
// -----------------------------------------------------------------------------
domain::ZKReceipt ReceiptEngine::newPendingReceipt(
    const domain::ProofRequest& request) const {
  const std::string now = now_rfc3339(clock_);

  domain::ZKReceipt receipt;
  receipt.version = config_.receipt_version;
  receipt.status = domain::ReceiptStatus::Pending;

  receipt.claim.type = request.claim_type;
  receipt.claim.statement = kPendingStatement;
  receipt.claim.claim_hash = integrity::pendingClaimHash(request);

  receipt.subject.venue = request.venue;
  receipt.subject.account_ref = request.account_ref;
  receipt.subject.order_ref = request.order_ref;
  receipt.subject.execution_ref = request.execution_ref;

  receipt.policy.policy_id = policy_.policyId();
  receipt.policy.finality_rule_id = policy_.finalityRuleId();
  receipt.policy.source_precedence_version = policy_.sourcePrecedenceVersion();

  receipt.provenance.evidence_root = integrity::emptyEvidenceRoot();

  receipt.timing.created_at = now;
  receipt.timing.updated_at = now;

  receipt.proof = prover::noProofMetadata();
  integrity::resealReceipt(receipt, config_.signer);
  return receipt;
}

// -----------------------------------------------------------------------------
// runPipeline(receipt_id, request): executed on a WorkerPool thread
// -----------------------------------------------------------------------------
void ReceiptEngine::runPipeline(const domain::ReceiptId& receipt_id,
                                const domain::ProofRequest& request) {
  auto current = get_receipt(receipt_id);
  if (!current) {
    throw ReceiptEngineError("receipt " + receipt_id +
                             " vanished from the store before processing");
  }
  domain::ZKReceipt receipt = std::move(*current);

  // ---  1) Adapter lookup ---------------------------------------------------
  auto adapter_it = adapters_.find(request.venue);
  if (adapter_it == adapters_.end()) {
    finalize(markNonProvable(
        std::move(receipt), domain::NonProvableReason::UnsupportedVenueClaim,
        std::string("No adapter registered for venue ") +
            domain::venueToString(request.venue)));
    return;
  }
  adapter::IVenueAdapter& adapter = *adapter_it->second;

  // ---  2) Acknowledgement --------------------------------------------------
  domain::ExecutionAck ack;
  try {
    ack = adapter.acknowledge(request);
  } catch (const std::exception& e) {
    finalize(markNonProvable(std::move(receipt),
                             domain::NonProvableReason::SourceUnavailable,
                             e.what()));
    return;
  }

  // ---  3) Evidence collection ----------------------------------------------
  domain::EvidenceBundle bundle;
  std::string evidence_root;
  try {
    bundle = adapter.collectEvidence(request, ack);
    evidence_root = bundle.evidenceRoot();
  } catch (const std::exception& e) {
    finalize(markNonProvable(std::move(receipt),
                             domain::NonProvableReason::SourceUnavailable,
                             e.what()));
    return;
  }

  // ---  4) Policy -----------------------------------------------------------
  policy::PolicyDecision decision =
      policy_.evaluate(request.venue, request.claim_type, bundle);
  if (!decision.ok) {
    finalize(markNonProvable(
        std::move(receipt),
        decision.reason.value_or(domain::NonProvableReason::PolicyViolation),
        std::move(decision.details)));
    return;
  }

  // ---  5) Statement synthesis ----------------------------------------------
  // The claim hash runs the statement through canonical JSON, so a
  // statement that is not valid UTF-8 fails here.
  std::string statement;
  std::string claim_hash;
  try {
    statement = adapter.buildStatement(request, ack, bundle);
    if (!statement.empty()) {
      claim_hash = integrity::statementClaimHash(
          request.claim_type, statement, request.order_ref, request.execution_ref);
    }
  } catch (const std::exception& e) {
    finalize(markNonProvable(std::move(receipt),
                             domain::NonProvableReason::PolicyViolation,
                             e.what()));
    return;
  }
  if (statement.empty()) {
    finalize(markNonProvable(std::move(receipt),
                             domain::NonProvableReason::PolicyViolation,
                             "Adapter produced an empty claim statement."));
    return;
  }

  // ---  6) + 7) Proving, then assemble PROVED -------------------------------
  const domain::ProofBackend expected_backend = prover_->backend();
  std::optional<domain::ZKReceipt> proved;
  std::string proof_error;
  try {
    domain::ProofMetadata proof = prover_->prove(integrity::publicInputs(
        claim_hash, evidence_root, request.venue, request.claim_type));
    if (proof.backend != expected_backend) {
      proof_error = std::string("Prover returned metadata for backend ") +
                    domain::proofBackendToString(proof.backend) + ", expected " +
                    domain::proofBackendToString(expected_backend) + ".";
    } else {
      proved = markProved(receipt, std::move(claim_hash), std::move(statement),
                          std::move(evidence_root), std::move(bundle),
                          std::move(proof));
    }
  } catch (const std::exception& e) {
    proof_error = e.what();
  }
  if (!proved) {
    finalize(markNonProvable(std::move(receipt),
                             domain::NonProvableReason::ProofFailure,
                             std::move(proof_error)));
    return;
  }

  // ---  8) Verification -----------------------------------------------------
  bool verified = false;
  try {
    verified = verifier_->verify(*proved);
  } catch (const std::exception& e) {
    std::cerr << "[ReceiptEngine] verifier threw for receipt " << receipt_id
              << ": " << e.what() << "\n";
  }
  if (!verified) {
    finalize(markNonProvable(std::move(*proved),
                             domain::NonProvableReason::ProofFailure,
                             kVerificationFailedDetails));
    return;
  }

  // ---  9) Store ------------------------------------------------------------
  finalize(std::move(*proved));
}

// -----------------------------------------------------------------------------
// markNonProvable(): the single NON_PROVABLE transition
// -----------------------------------------------------------------------------
domain::ZKReceipt ReceiptEngine::markNonProvable(domain::ZKReceipt receipt,
                                                 domain::NonProvableReason reason,
                                                 std::string details) const {
  receipt.status = domain::ReceiptStatus::NonProvable;
  receipt.non_provable = domain::NonProvable{reason, std::move(details)};
  receipt.timing.updated_at = now_rfc3339(clock_);
  receipt.proof = prover::noProofMetadata();
  integrity::resealReceipt(receipt, config_.signer);
  return receipt;
}

domain::ZKReceipt ReceiptEngine::markProved(domain::ZKReceipt receipt,
                                            std::string claim_hash,
                                            std::string statement,
                                            std::string evidence_root,
                                            domain::EvidenceBundle bundle,
                                            domain::ProofMetadata proof) const {
  const std::string now = now_rfc3339(clock_);

  receipt.status = domain::ReceiptStatus::Proved;
  receipt.claim.statement = std::move(statement);
  receipt.claim.claim_hash = std::move(claim_hash);

  receipt.provenance.evidence_root = std::move(evidence_root);
  receipt.provenance.evidence_items = std::move(bundle.items);

  receipt.timing.updated_at = now;
  receipt.timing.execution_observed_at = now;
  receipt.timing.finality_observed_at = std::move(bundle.finality_observed_at);

  receipt.proof = std::move(proof);
  receipt.non_provable.reset();
  integrity::resealReceipt(receipt, config_.signer);
  return receipt;
}

// -----------------------------------------------------------------------------
// finalize(receipt): terminal write + ReceiptFinalizedEvent
// -----------------------------------------------------------------------------
void ReceiptEngine::finalize(domain::ZKReceipt receipt) {
  if (receipt.non_provable) {
    std::cerr << "[ReceiptEngine] receipt " << receipt.receipt_id
              << " NON_PROVABLE ("
              << domain::nonProvableReasonToString(receipt.non_provable->reason_code)
              << "): " << receipt.non_provable->details << "\n";
  } else {
    std::cout << "[ReceiptEngine] receipt " << receipt.receipt_id << " "
              << domain::receiptStatusToString(receipt.status) << ".\n";
  }

  ReceiptFinalizedEvent event{receipt, clock_.now_ms()};
  {
    std::lock_guard lock(store_mutex_);
    store_[receipt.receipt_id] = std::move(receipt);
  }

  event_bus_.publish(event);
}

}  // namespace zkr
