/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "rt_bsa/source/telemetry_source.hpp"
#include "rt_bsa/stream/beamline.hpp"
#include "rt_bsa/stream/gap_monitor.hpp"
#include "rt_bsa/stream/pulse_id.hpp"
#include "rt_bsa/stream/sample_ring_buffer.hpp"
#include "rt_bsa/stream/stream_errors.hpp"

namespace rt_bsa {

struct StreamConfig {
  std::string channel;  // BSA PV root name, without event definition
  Beamline beamline{Beamline::NC_HXR};
};

/**
 * @brief Buffer contents and the pulse ID of the newest sample
 */
struct StreamSnapshot {
  std::vector<double> buffer;  // kBufferLength samples, oldest-first
  PulseId pulse_id{0};
};

/**
 * @brief Streams one BSA channel into a 2800-sample history in real time
 *
 * The buffer is seeded from the channel's history buffer PV and then fed by
 * live value updates. Pulses missed between two updates are padded with NaN.
 * The beam rate is followed live; its derived timing constants are used to
 * predict the next pulse ID.
 *
 * Value and rate callbacks arrive on the source's delivery thread(s);
 * snapshot() may be called from any other thread.
 */
class BSAStreamBuffer {
 public:
  /**
   * @param source Subscription layer, must outlive the stream
   * @param config Channel and beamline
   * @param gap_monitor Sink for missed-pulse events (a private one if null)
   * @param raise_on_failure Throw StreamInitError if initialization fails
   */
  BSAStreamBuffer(TelemetrySource& source, const StreamConfig& config,
                  std::shared_ptr<GapMonitor> gap_monitor = nullptr,
                  bool raise_on_failure = true);
  ~BSAStreamBuffer();

  BSAStreamBuffer(const BSAStreamBuffer&) = delete;
  BSAStreamBuffer& operator=(const BSAStreamBuffer&) = delete;

  /// Copy of the buffer and its latest pulse ID, taken atomically
  StreamSnapshot snapshot() const;

  /// Apply a new channel + beamline, then reinitialize
  void reconfigure(const StreamConfig& config, bool raise_on_failure = false);
  void set_channel(const std::string& channel);
  void set_beamline(Beamline beamline);
  void set_beamline(const std::string& beamline);

  /// Unsubscribe from value and rate updates. Idempotent.
  void stop();

  /// Live value update (delivery thread). Never throws.
  void on_value_update(double value, uint64_t nanoseconds);

  /// Live beam rate update (delivery thread). Never throws.
  void on_rate_update(double rate);

  // Configuration
  const std::string& channel() const { return config_.channel; }
  Beamline beamline() const { return config_.beamline; }
  std::string history_address() const;
  bool is_enabled() const;

  // Rate and derived timing constants (NaN without beam)
  double sample_rate() const;
  double sample_spacing() const;
  double ticks_per_sample() const;
  double buffer_modulus() const;

  // Pulse cursor
  PulseId latest_pulse_id() const;
  double previous_pulse_id() const;

  std::shared_ptr<GapMonitor> gap_monitor() const { return gap_monitor_; }

 private:
  void initialize(bool raise_on_failure);
  void detach_subscriptions();
  static void validate(const StreamConfig& config);

  // Caller holds mutex_
  void apply_rate_locked(double rate);

 private:
  TelemetrySource& source_;
  StreamConfig config_;
  std::shared_ptr<GapMonitor> gap_monitor_;

  // Serializes initialize()/stop() from the control side
  std::mutex control_mutex_;
  SubscriptionHandle value_handle_{kInvalidSubscription};
  SubscriptionHandle rate_handle_{kInvalidSubscription};

  // Guards everything below
  mutable std::mutex mutex_;
  SampleRingBuffer buffer_;
  PulseId latest_pulse_id_{0};
  double previous_pulse_id_{0.0};
  double max_rate_;
  double sample_rate_;
  double sample_spacing_;
  double ticks_per_sample_;
  double buffer_modulus_;
  std::string history_address_;
  bool enabled_{false};
};

}  // namespace rt_bsa
