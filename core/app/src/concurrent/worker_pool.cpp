#include "zkr/concurrent/worker_pool.hpp"

#include <chrono>
#include <utility>

namespace zkr {

namespace {

// Upper bound on how long an idle worker sleeps before re-checking the
// queue and the stop flag.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

WorkerPool::WorkerPool(std::size_t thread_count)
    : thread_count_(thread_count == 0 ? 1 : thread_count) {}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
  if (!threads_.empty()) {
    return;
  }

  running_.store(true);

  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back([this] { run(); });
  }
}

void WorkerPool::stop() {
  if (threads_.empty()) {
    return;
  }

  running_.store(false);
  wake_cv_.notify_all();

  for (auto& thread : threads_) {
    thread.join();
  }
  threads_.clear();
}

std::shared_future<void> WorkerPool::schedule(std::function<void()> work) {
  Task task(std::move(work));
  std::shared_future<void> done = task.get_future().share();

  queue_.push(std::move(task));
  wake_cv_.notify_one();

  return done;
}

// -----------------------------------------------------------------------------
// run(): pop-and-execute until stopped AND the queue is drained
// -----------------------------------------------------------------------------
void WorkerPool::run() {
  for (;;) {
    std::optional<Task> task = queue_.try_pop();

    if (task) {
      // packaged_task stores any exception in the shared state; nothing
      // escapes into the worker thread.
      (*task)();
      continue;
    }

    if (!running_.load()) {
      return;
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, kIdleWaitTimeout, [this] {
      return !running_.load() || !queue_.empty();
    });
  }
}

}  // namespace zkr
