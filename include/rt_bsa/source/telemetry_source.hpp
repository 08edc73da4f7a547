/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rt_bsa {

/**
 * @brief Exception type for subscription layer failures
 */
class TelemetrySourceException : public std::runtime_error {
 public:
  explicit TelemetrySourceException(const std::string& msg)
      : std::runtime_error("TelemetrySource error: " + msg) {}
};

using SubscriptionHandle = uint64_t;
constexpr SubscriptionHandle kInvalidSubscription = 0;

/// Live scalar update: value and the timestamp nanoseconds field
using ValueCallback = std::function<void(double value, uint64_t nanoseconds)>;

/// Beam rate update (Hz); zero or NaN means no beam
using RateCallback = std::function<void(double rate)>;

/**
 * @brief Snapshot of a history buffer PV
 */
struct HistoryBuffer {
  std::vector<double> values;  // oldest-first
  uint64_t nanoseconds{0};     // timestamp of the newest value
};

/**
 * @brief Live subscription layer consumed by the BSA streams
 *
 * Callbacks are invoked on threads owned by the implementation. After
 * unsubscribe() returns, the callback of that handle is never invoked again.
 * Methods throw TelemetrySourceException on failure.
 */
class TelemetrySource {
 public:
  virtual ~TelemetrySource() = default;

  virtual HistoryBuffer fetch_history(const std::string& address) = 0;
  virtual double read_rate(const std::string& address) = 0;

  virtual SubscriptionHandle subscribe(const std::string& address,
                                       ValueCallback on_value) = 0;
  virtual SubscriptionHandle subscribe_rate(const std::string& address,
                                            RateCallback on_rate) = 0;
  virtual void unsubscribe(SubscriptionHandle handle) = 0;
};

}  // namespace rt_bsa
