/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "rt_bsa/source/telemetry_source.hpp"
#include "rt_bsa/source/update_fifo.hpp"

namespace rt_bsa {

/**
 * @brief In-process telemetry source with its own delivery thread
 *
 * Publishers enqueue value and rate events into a drop-oldest FIFO; the
 * delivery thread drains it and routes each event to the subscribers of its
 * address. Used by the tests, the demo and the pressure test in place of a
 * live control system connection.
 */
class SimulatedSource : public TelemetrySource {
 public:
  explicit SimulatedSource(size_t queue_depth = 4096);
  ~SimulatedSource() override;

  // Thread controls
  bool enable_delivery_thread();
  void disable_delivery_thread();
  bool is_delivering() const { return delivery_thread_running_; }

  // Channel setup
  void add_channel(const std::string& address);
  void set_history(const std::string& address, const HistoryBuffer& history);
  void set_rate(const std::string& address, double rate);
  void set_fail_history(bool fail) { fail_history_ = fail; }

  // Publishing (any thread)
  void publish_value(const std::string& address, double value,
                     uint64_t nanoseconds);
  void publish_rate(const std::string& address, double rate);

  /// Wait until every queued event has been delivered. False on timeout.
  bool flush(int timeout_ms = 1000);

  size_t subscription_count(const std::string& address) const;
  uint64_t delivered_count() const { return delivered_.load(); }
  uint64_t dropped_count() const { return fifo_.overflow_drop_old_count(); }

  // TelemetrySource
  HistoryBuffer fetch_history(const std::string& address) override;
  double read_rate(const std::string& address) override;
  SubscriptionHandle subscribe(const std::string& address,
                               ValueCallback on_value) override;
  SubscriptionHandle subscribe_rate(const std::string& address,
                                    RateCallback on_rate) override;
  void unsubscribe(SubscriptionHandle handle) override;

 private:
  struct Subscription {
    TelemetryEvent::Kind kind;
    std::string address;
    ValueCallback on_value;
    RateCallback on_rate;
  };

  // Threads
  void deliveryThread();

  // Route one event to its subscribers
  void dispatch(const TelemetryEvent& event);

  void enqueue(const TelemetryEvent& event);

 private:
  // Channel state
  mutable std::mutex state_mutex_;
  std::set<std::string> channels_;
  std::map<std::string, HistoryBuffer> histories_;
  std::map<std::string, double> rates_;
  std::atomic<bool> fail_history_{false};

  // Subscriptions
  mutable std::mutex subs_mutex_;
  std::map<SubscriptionHandle, Subscription> subs_;
  SubscriptionHandle next_handle_{1};

  // Held while callbacks run; unsubscribe() waits on it
  std::mutex dispatch_mutex_;

  // Delivery
  UpdateFifo fifo_;
  std::atomic<uint64_t> pending_{0};
  std::atomic<uint64_t> delivered_{0};
  std::thread delivery_thread_;
  std::atomic<bool> delivery_thread_running_{false};
};

}  // namespace rt_bsa
