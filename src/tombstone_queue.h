#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "location.h"

namespace bitkv {

// FIFO of locations waiting to be erased. Many producers, one consumer.
class TombstoneQueue {
 public:
  void Push(const LocationRecord& record);
  // Waits up to timeout for an entry. Returns false on timeout or after Stop().
  // Every successful pop must be followed by Done().
  bool PopFor(std::chrono::milliseconds timeout, LocationRecord& out);
  void Done();
  // Blocks until the queue is empty and no popped entry is in flight.
  void WaitIdle();
  void Stop();

  [[nodiscard]] bool stopped() const;
  [[nodiscard]] std::size_t Pending() const;

 private:
  mutable std::mutex mu_;
  std::condition_variable ready_cv_;
  std::condition_variable idle_cv_;
  std::deque<LocationRecord> queue_;
  std::size_t in_flight_{0};
  bool stop_{false};
};

}  // namespace bitkv
