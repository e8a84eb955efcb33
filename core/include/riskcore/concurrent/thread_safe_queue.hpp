#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace riskcore {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Unbounded FIFO shared between threads. Producers push() from any thread;
// the owning worker drains with try_pop() between its other duties, so no
// consumer ever blocks on it.
//
// Used by IpcServer to hand telemetry from whichever thread produced an
// assessment to the thread that owns the PUB socket (ZeroMQ sockets must
// stay on one thread).
//
// Thread model: every method locks mutex_; safe for any number of producers
// and consumers.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(value));
  }

  // Front item, or std::nullopt immediately if the queue is empty.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may change it right after.
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
  std::deque<T> queue_;
};

}  // namespace riskcore
