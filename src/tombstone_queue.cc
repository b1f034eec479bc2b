#include "tombstone_queue.h"

namespace bitkv {

void TombstoneQueue::Push(const LocationRecord& record) {
  {
    std::lock_guard lk(mu_);
    queue_.push_back(record);
  }
  ready_cv_.notify_one();
}

bool TombstoneQueue::PopFor(std::chrono::milliseconds timeout, LocationRecord& out) {
  std::unique_lock lk(mu_);
  if (!ready_cv_.wait_for(lk, timeout, [this] { return stop_ || !queue_.empty(); })) return false;
  if (stop_) return false;
  out = queue_.front();
  queue_.pop_front();
  ++in_flight_;
  return true;
}

void TombstoneQueue::Done() {
  std::lock_guard lk(mu_);
  if (in_flight_ > 0) --in_flight_;
  if (queue_.empty() && in_flight_ == 0) idle_cv_.notify_all();
}

void TombstoneQueue::WaitIdle() {
  std::unique_lock lk(mu_);
  idle_cv_.wait(lk, [this] { return stop_ || (queue_.empty() && in_flight_ == 0); });
}

void TombstoneQueue::Stop() {
  {
    std::lock_guard lk(mu_);
    stop_ = true;
  }
  ready_cv_.notify_all();
  idle_cv_.notify_all();
}

bool TombstoneQueue::stopped() const {
  std::lock_guard lk(mu_);
  return stop_;
}

std::size_t TombstoneQueue::Pending() const {
  std::lock_guard lk(mu_);
  return queue_.size() + in_flight_;
}

}  // namespace bitkv
