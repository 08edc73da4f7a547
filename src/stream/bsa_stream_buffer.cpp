/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#include "rt_bsa/stream/bsa_stream_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <string>

namespace rt_bsa {

namespace {
const double kNaN = std::numeric_limits<double>::quiet_NaN();
}

BSAStreamBuffer::BSAStreamBuffer(TelemetrySource& source,
                                 const StreamConfig& config,
                                 std::shared_ptr<GapMonitor> gap_monitor,
                                 bool raise_on_failure)
    : source_(source),
      config_(config),
      gap_monitor_(gap_monitor ? std::move(gap_monitor)
                               : std::make_shared<GapMonitor>()),
      buffer_(kBufferLength),
      max_rate_(kNaN),
      sample_rate_(kNaN),
      sample_spacing_(kNaN),
      ticks_per_sample_(kNaN),
      buffer_modulus_(kNaN) {
  validate(config_);
  initialize(raise_on_failure);
}

BSAStreamBuffer::~BSAStreamBuffer() {
  try {
    stop();
  } catch (const std::exception& e) {
    std::cerr << "[BSAStream] WARNING: stop failed for " << config_.channel
              << ": " << e.what() << std::endl;
  }
}

// ----------------------------- Configuration --------------------------------

void BSAStreamBuffer::validate(const StreamConfig& config) {
  if (config.channel.empty()) {
    throw ConfigurationError("empty BSA channel name");
  }
  // throws ConfigurationError for an out-of-range enumerator
  beamline_info(config.beamline);
}

void BSAStreamBuffer::reconfigure(const StreamConfig& config,
                                  bool raise_on_failure) {
  validate(config);
  stop();
  config_ = config;
  initialize(raise_on_failure);
}

void BSAStreamBuffer::set_channel(const std::string& channel) {
  StreamConfig config = config_;
  config.channel = channel;
  reconfigure(config);
}

void BSAStreamBuffer::set_beamline(Beamline beamline) {
  StreamConfig config = config_;
  config.beamline = beamline;
  reconfigure(config);
}

void BSAStreamBuffer::set_beamline(const std::string& beamline) {
  set_beamline(parse_beamline(beamline));
}

// ----------------------------- Lifecycle ------------------------------------

void BSAStreamBuffer::initialize(bool raise_on_failure) {
  std::lock_guard<std::mutex> control(control_mutex_);

  // old callbacks must be gone before the buffer is replaced
  detach_subscriptions();

  const BeamlineInfo& info = beamline_info(config_.beamline);
  try {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      enabled_ = false;
      max_rate_ = info.max_rate;
      buffer_.clear();
    }

    rate_handle_ = source_.subscribe_rate(
        info.rate_address, [this](double rate) { on_rate_update(rate); });

    // use whatever the fastest populating edef is for the current beam rate
    const double rate = source_.read_rate(info.rate_address);
    std::string address;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      apply_rate_locked(rate);
      address = rt_bsa::history_address(config_.channel, config_.beamline,
                                        sample_rate_);
      history_address_ = address;
    }

    // seed from the history buffer, then start streaming under the same lock
    // so no update lands between the two
    {
      std::lock_guard<std::mutex> lock(mutex_);
      HistoryBuffer history = source_.fetch_history(address);
      if (history.values.size() != kBufferLength) {
        throw TelemetrySourceException(
            "history buffer " + address + " has " +
            std::to_string(history.values.size()) + " samples, expected " +
            std::to_string(kBufferLength));
      }
      buffer_.assign(history.values);
      latest_pulse_id_ = ns_to_pulse_id(history.nanoseconds);
      previous_pulse_id_ = wrap_pulse_id(
          static_cast<double>(latest_pulse_id_) - ticks_per_sample_);

      value_handle_ = source_.subscribe(
          config_.channel, [this](double value, uint64_t nanoseconds) {
            on_value_update(value, nanoseconds);
          });
      enabled_ = true;
    }

    std::cout << "[BSAStream] " << info.name << " streaming " << config_.channel
              << " (rate " << rate << " Hz, history " << address << ")"
              << std::endl;

  } catch (const std::exception& e) {
    detach_subscriptions();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      enabled_ = false;
    }
    if (raise_on_failure) {
      std::cerr << "[BSAStream] " << info.name << " BSAStreamBuffer init for "
                << config_.channel << " failed" << std::endl;
      throw StreamInitError(e.what());
    }
    std::cerr << "[BSAStream] WARNING: Invalid BSAStreamBuffer definition: "
              << info.name << " " << config_.channel << " (" << e.what()
              << ")" << std::endl;
  }
}

void BSAStreamBuffer::stop() {
  std::lock_guard<std::mutex> control(control_mutex_);
  detach_subscriptions();
  std::lock_guard<std::mutex> lock(mutex_);
  enabled_ = false;
}

// Caller holds control_mutex_, never mutex_ (unsubscribe waits for callbacks)
void BSAStreamBuffer::detach_subscriptions() {
  for (SubscriptionHandle* handle : {&value_handle_, &rate_handle_}) {
    if (*handle == kInvalidSubscription) continue;
    try {
      source_.unsubscribe(*handle);
    } catch (const std::exception& e) {
      std::cerr << "[BSAStream] WARNING: unsubscribe failed for "
                << config_.channel << ": " << e.what() << std::endl;
    }
    *handle = kInvalidSubscription;
  }
}

// ----------------------------- Update Path ----------------------------------
// append the latest value; pulses missed since the last update are NaN padded
void BSAStreamBuffer::on_value_update(double value, uint64_t nanoseconds) {
  try {
    MissedPulseEvent gap;
    bool has_gap = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!enabled_ || !(sample_rate_ > 0.0) ||
          !std::isfinite(ticks_per_sample_)) {
        return;
      }

      const PulseId new_id = ns_to_pulse_id(nanoseconds);
      const double expected =
          wrap_pulse_id(static_cast<double>(latest_pulse_id_) +
                        ticks_per_sample_);
      const long missed = static_cast<long>(
          pulse_id_delta(expected, static_cast<double>(new_id)) /
          ticks_per_sample_);

      if (missed > 0) {
        buffer_.shift_nan(static_cast<size_t>(missed));
        gap = MissedPulseEvent{config_.channel, missed, latest_pulse_id_,
                               new_id};
        has_gap = true;
      }

      buffer_.push(value);
      previous_pulse_id_ = static_cast<double>(latest_pulse_id_);
      latest_pulse_id_ = new_id;
    }

    if (has_gap) {
      gap_monitor_->record_missed(gap);
    }
  } catch (const std::exception& e) {
    std::cerr << "[BSAStream] ERROR: value update for " << config_.channel
              << " failed: " << e.what() << std::endl;
  }
}

void BSAStreamBuffer::on_rate_update(double rate) {
  try {
    std::lock_guard<std::mutex> lock(mutex_);
    apply_rate_locked(rate);
  } catch (const std::exception& e) {
    std::cerr << "[BSAStream] ERROR: rate update for " << config_.channel
              << " failed: " << e.what() << std::endl;
  }
}

void BSAStreamBuffer::apply_rate_locked(double rate) {
  sample_rate_ = std::min(rate, max_rate_);
  if (!(rate > 0.0) || !std::isfinite(sample_rate_)) {
    sample_spacing_ = kNaN;
    ticks_per_sample_ = kNaN;
    buffer_modulus_ = kNaN;
    return;
  }
  sample_spacing_ = 1.0 / sample_rate_;
  ticks_per_sample_ = kFiducialRate / sample_rate_;
  buffer_modulus_ =
      std::floor(static_cast<double>(kPulseIdModulus) / ticks_per_sample_);
}

// ----------------------------- Read Path ------------------------------------

StreamSnapshot BSAStreamBuffer::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  StreamSnapshot snap;
  snap.buffer = buffer_.to_vector();
  snap.pulse_id = latest_pulse_id_;
  return snap;
}

std::string BSAStreamBuffer::history_address() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_address_;
}

bool BSAStreamBuffer::is_enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_;
}

double BSAStreamBuffer::sample_rate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sample_rate_;
}

double BSAStreamBuffer::sample_spacing() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sample_spacing_;
}

double BSAStreamBuffer::ticks_per_sample() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ticks_per_sample_;
}

double BSAStreamBuffer::buffer_modulus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_modulus_;
}

PulseId BSAStreamBuffer::latest_pulse_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_pulse_id_;
}

double BSAStreamBuffer::previous_pulse_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return previous_pulse_id_;
}

}  // namespace rt_bsa
