#pragma once

#include "zkr/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace zkr {

// -----------------------------------------------------------------------------
// WorkerPool
// -----------------------------------------------------------------------------
// Responsibility: Owns a fixed number of worker threads that drain a shared
// ThreadSafeQueue of tasks. ReceiptEngine schedules one task per submitted
// request; the pool runs them concurrently without a thread per request.
//
// Each scheduled task is wrapped in a std::packaged_task and the caller gets
// back a std::shared_future<void>. The shared future is the task's
// completion signal: any number of threads may wait on it, and an exception
// escaping the task is stored in it and rethrown from get().
//
// Thread model: start()/stop() are called by the owner (ReceiptEngine).
// schedule() is safe from any thread. Tasks run on pool threads, in FIFO
// order of scheduling but with no ordering between concurrently running
// tasks.
//
// Shutdown: stop() lets the workers drain every task already queued before
// they exit, so no scheduled task is silently dropped.
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  using Task = std::packaged_task<void()>;

  // @param  thread_count  Number of worker threads spawned by start().
  //                       Values below 1 are raised to 1.
  explicit WorkerPool(std::size_t thread_count);

  // Joins all workers (RAII).
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // What: Spawns the worker threads. Tasks scheduled before start() stay
  // queued and run once the workers are up. Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Signals the workers to exit once the queue is empty and joins
  // them. start() may be called again afterwards. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // schedule(work)
  // -------------------------------------------------------------------------
  // What: Enqueues work and returns its completion signal.
  // Thread-safety: Safe from any thread. Never blocks on running tasks.
  // -------------------------------------------------------------------------
  std::shared_future<void> schedule(std::function<void()> work);

  std::size_t threadCount() const { return thread_count_; }

  // Number of tasks queued but not yet picked up by a worker.
  std::size_t pending() const { return queue_.size(); }

 private:
  void run();

  std::size_t thread_count_;
  ThreadSafeQueue<Task> queue_;
  std::atomic<bool> running_{false};

  // Wakes idle workers on schedule() and on stop().
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;

  std::vector<std::thread> threads_;
};

}  // namespace zkr
