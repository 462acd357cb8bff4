#pragma once

#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace tokensale {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded multi-producer / multi-consumer FIFO. The engine
// thread that commits a purchase pushes notifications; the IPC worker drains
// them and broadcasts on the PUB socket without ever blocking the purchase
// path.
//
// Thread model: every method is safe from any thread. pop() blocks until an
// item is available; try_pop() and drain() never block.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable, non-movable: the mutex and condition variable are neither.
  // Share the queue by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item to the back of the queue and wakes one thread
  // blocked in pop(), if any.
  // Thread-safety: Safe from any thread. The mutex is held only while the
  // deque is modified; the notification happens after it is released.
  // Input: value, taken by value so callers can std::move a notification in.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer does not immediately
    // block on mutex_.
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting until one is pushed if
  // the queue is empty.
  // Thread-safety: Safe from any thread. The wait predicate is re-checked
  // after every wakeup, spurious ones included.
  // Output: T, moved out of the queue.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    // unique_lock, not lock_guard: wait() releases and re-acquires it.
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop() — non-blocking
  // -------------------------------------------------------------------------
  // What: Removes the front item if there is one, otherwise returns
  // std::nullopt at once.
  // Output: std::optional<T>. The item is moved straight into the optional,
  // so move-only T works.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    std::optional<T> value(std::move(queue_.front()));
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // drain()
  // -------------------------------------------------------------------------
  // What: Takes everything currently queued in one critical section,
  // preserving order. Items pushed after the swap stay for the next call.
  // Why: The IPC worker publishes a batch of notifications per loop
  // iteration without taking the lock once per item.
  // Thread-safety: Safe from any thread. The moved-out items are converted
  // to a vector after the lock is released.
  // -------------------------------------------------------------------------
  std::vector<T> drain() {
    std::deque<T> taken;
    {
      std::lock_guard lock(mutex_);
      taken.swap(queue_);
    }
    return std::vector<T>(std::make_move_iterator(taken.begin()),
                          std::make_move_iterator(taken.end()));
  }

  // Snapshot only: another thread may push or pop right after the check.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  // Guards queue_. mutable so the const observers can lock it.
  mutable std::mutex mutex_;

  // Signalled on push. The queue is unbounded, so there is no "not full"
  // condition.
  std::condition_variable condition_;

  // O(1) push_back and pop_front; drain() swaps the whole deque out.
  std::deque<T> queue_;
};

}  // namespace tokensale
