/**************************************************
 * Telemetry Update FIFO (thread-safe)
 * - FIFO semantics (oldest-out)
 * - When full: drop the oldest event (keep newest)
 * - Supports both blocking and non-blocking pop
 *
 * Copyright (c) 2025
 * MIT License
 **************************************************/
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace rt_bsa {

/**
 * @brief One queued update from the subscription layer.
 */
struct TelemetryEvent {
  enum class Kind { VALUE, RATE };

  Kind kind{Kind::VALUE};
  std::string address;
  double value{0.0};
  uint64_t nanoseconds{0};  // unused for RATE events
};

/**
 * @brief Thread-safe update FIFO between publishers and the delivery thread.
 *
 * Design goals:
 *  - Preserve newest data under back pressure by dropping the oldest event when full.
 *  - Provide both blocking and non-blocking APIs.
 *
 * Note:
 *  - All methods are thread-safe.
 *  - "wait_and_pop" supports timeout; returns false on timeout.
 */
class UpdateFifo {
public:
  /// Construct with a maximum capacity (number of events).
  explicit UpdateFifo(size_t max_size = 4096);

  /// Change maximum capacity.
  void set_max_size(size_t n);

  /// Current number of events queued.
  size_t size() const;

  /// Clear all queued events.
  void clear();

  /// Push an event. Returns true if the oldest event was dropped to make room.
  bool push(const TelemetryEvent& e);

  /// Non-blocking pop: FIFO order (oldest first).
  bool try_pop(TelemetryEvent& out);

  /// Blocking pop: FIFO order (oldest first). Returns false on timeout.
  bool wait_and_pop(TelemetryEvent& out, int timeout_ms = 100);

  /// Number of times the queue was full and the oldest event was dropped.
  uint64_t overflow_drop_old_count() const;

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<TelemetryEvent> q_;
  size_t max_size_;
  std::atomic<uint64_t> overflow_drop_old_{0};
};

}  // namespace rt_bsa
