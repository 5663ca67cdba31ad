#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace zkr {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A FIFO queue that multiple threads can push to and pop from
// without data races. Provides blocking pop() and non-blocking try_pop().
//
// Used at the two thread boundaries of the engine:
//   - ReceiptEngine::submit() (caller thread) → WorkerPool threads, carrying
//     one pipeline task per submission.
//   - ReceiptEngine event bus (worker threads) → ReceiptServer thread,
//     carrying finalized-receipt telemetry.
//
// T may be move-only (e.g. std::packaged_task<void()>): values are moved in
// and moved out, never copied.
//
// Thread model: Safe for multiple producers and multiple consumers.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable, non-movable: owns a mutex and a condition variable.
  // Share the queue by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item and wakes one blocked pop(), if any.
  // Thread-safety: Safe to call from any thread. Never blocks beyond the
  // short critical section, so submit() stays non-blocking.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken thread does not immediately
    // block on the mutex we still hold.
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting until one exists.
  // The predicate form of wait() handles spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });

    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, or std::nullopt immediately
  // if the queue is empty. Worker loops use this so they can also observe
  // their stop flag.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may push or pop immediately after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;  // Signalled on every push
  std::deque<T> queue_;
};

}  // namespace zkr
