/**************************************************
 * Telemetry Update FIFO (thread-safe) - Implementation
 *
 * - Implements FIFO semantics (oldest-out)
 * - When full: drop the oldest event
 * - Supports both blocking and non-blocking pop
 *
 * Copyright (c) 2025
 * MIT License
 **************************************************/

#include "rt_bsa/source/update_fifo.hpp"

#include <algorithm>

namespace rt_bsa {

UpdateFifo::UpdateFifo(size_t max_size)
    : max_size_(std::max<size_t>(max_size, 1)) {}

void UpdateFifo::set_max_size(size_t n) {
  std::lock_guard<std::mutex> lk(mtx_);
  max_size_ = std::max<size_t>(n, 1);
  while (q_.size() > max_size_) {
    q_.pop_front();
    ++overflow_drop_old_;
  }
}

size_t UpdateFifo::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return q_.size();
}

void UpdateFifo::clear() {
  std::lock_guard<std::mutex> lk(mtx_);
  q_.clear();
}

bool UpdateFifo::push(const TelemetryEvent& e) {
  bool dropped = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (q_.size() >= max_size_) {
      // Drop the oldest event to keep the most recent one
      q_.pop_front();
      ++overflow_drop_old_;
      dropped = true;
    }
    q_.push_back(e);
  }
  cv_.notify_one();
  return dropped;
}

bool UpdateFifo::try_pop(TelemetryEvent& out) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (q_.empty()) return false;
  out = std::move(q_.front());
  q_.pop_front();
  return true;
}

bool UpdateFifo::wait_and_pop(TelemetryEvent& out, int timeout_ms) {
  std::unique_lock<std::mutex> lk(mtx_);
  if (!cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                    [&] { return !q_.empty(); }))
    return false;
  out = std::move(q_.front());
  q_.pop_front();
  return true;
}

uint64_t UpdateFifo::overflow_drop_old_count() const {
  return overflow_drop_old_.load();
}

}  // namespace rt_bsa
