#pragma once

#include "barsim/events/event.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>

namespace barsim {

// -----------------------------------------------------------------------------
// FifoQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded first-in first-out queue with a non-blocking
// pop. Items come out in exactly the order they were put in.
//
// Why in architecture: The backtest is single-threaded and deterministic.
// Every component that produces events (data source, strategy, portfolio,
// execution simulator) appends to one shared queue, and the scheduler drains
// it. There is no blocking pop: an empty queue means "this tick is done".
//
// Thread model: Not synchronised. One queue belongs to one backtest run, and
// a run lives on a single thread. Parallel sweeps give each run its own
// queue.
// -----------------------------------------------------------------------------
template <typename T>
class FifoQueue {
 public:
  FifoQueue() = default;

  // Non-copyable: components hold the queue by reference. A copy would
  // silently split the event stream in two.
  FifoQueue(const FifoQueue&) = delete;
  FifoQueue& operator=(const FifoQueue&) = delete;

  // Appends one item to the back.
  void put(T value) { queue_.push_back(std::move(value)); }

  // -------------------------------------------------------------------------
  // try_pop()
  // -------------------------------------------------------------------------
  // Removes and returns the front item, or std::nullopt when the queue is
  // empty. The scheduler treats nullopt as the end of the current tick.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  bool empty() const { return queue_.empty(); }
  std::size_t size() const { return queue_.size(); }

  // Drops everything still queued. Used when a run aborts.
  void clear() { queue_.clear(); }

 private:
  std::deque<T> queue_;
};

// The event channel shared by every component of one backtest run.
using EventQueue = FifoQueue<Event>;

}  // namespace barsim
