/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#include "rt_bsa/stream/dual_bsa_stream_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <iostream>

namespace rt_bsa {

DualBSAStreamBuffer::DualBSAStreamBuffer(TelemetrySource& source,
                                         const DualStreamConfig& config,
                                         std::shared_ptr<GapMonitor> gap_monitor)
    : source_(source),
      config_(config),
      gap_monitor_(gap_monitor ? std::move(gap_monitor)
                               : std::make_shared<GapMonitor>()) {
  validate(config_);
  try {
    build_streams(true);
  } catch (const std::exception&) {
    std::cerr << "[DualBSAStream] " << beamline_name(config_.beamline)
              << " DualBSAStreamBuffer init with [" << config_.ch1 << ", "
              << config_.ch2 << "] failed" << std::endl;
    throw;
  }
}

DualBSAStreamBuffer::~DualBSAStreamBuffer() {
  try {
    stop();
  } catch (const std::exception& e) {
    std::cerr << "[DualBSAStream] WARNING: stop failed: " << e.what()
              << std::endl;
  }
}

void DualBSAStreamBuffer::validate(const DualStreamConfig& config) {
  if (config.ch1.empty() || config.ch2.empty()) {
    throw ConfigurationError("empty BSA channel name");
  }
  beamline_info(config.beamline);
}

// Caller holds streams_mutex_ or is the constructor
void DualBSAStreamBuffer::build_streams(bool raise_on_failure) {
  if (stream_a_) stream_a_->stop();
  if (stream_b_) stream_b_->stop();
  stream_a_.reset();
  stream_b_.reset();

  stream_a_ = std::make_unique<BSAStreamBuffer>(
      source_, StreamConfig{config_.ch1, config_.beamline}, gap_monitor_,
      raise_on_failure);
  stream_b_ = std::make_unique<BSAStreamBuffer>(
      source_, StreamConfig{config_.ch2, config_.beamline}, gap_monitor_,
      raise_on_failure);

  synced_point_count_ = -1;
}

// ----------------------------- Configuration --------------------------------

void DualBSAStreamBuffer::reconfigure(const DualStreamConfig& config) {
  validate(config);
  std::lock_guard<std::mutex> lock(streams_mutex_);
  config_ = config;
  build_streams(false);
  if (!stream_a_->is_enabled() || !stream_b_->is_enabled()) {
    std::cerr << "[DualBSAStream] WARNING: Invalid DualBSAStreamBuffer "
                 "definition: "
              << beamline_name(config_.beamline) << " [" << config_.ch1
              << ", " << config_.ch2 << "]" << std::endl;
  }
}

void DualBSAStreamBuffer::set_ch1(const std::string& channel) {
  DualStreamConfig config = config_;
  config.ch1 = channel;
  reconfigure(config);
}

void DualBSAStreamBuffer::set_ch2(const std::string& channel) {
  DualStreamConfig config = config_;
  config.ch2 = channel;
  reconfigure(config);
}

void DualBSAStreamBuffer::set_beamline(Beamline beamline) {
  DualStreamConfig config = config_;
  config.beamline = beamline;
  reconfigure(config);
}

void DualBSAStreamBuffer::set_beamline(const std::string& beamline) {
  set_beamline(parse_beamline(beamline));
}

void DualBSAStreamBuffer::stop() {
  std::lock_guard<std::mutex> lock(streams_mutex_);
  if (stream_a_) stream_a_->stop();
  if (stream_b_) stream_b_->stop();
}

// ----------------------------- Synchronization ------------------------------

SyncedSnapshot DualBSAStreamBuffer::align() {
  std::lock_guard<std::mutex> lock(streams_mutex_);

  StreamSnapshot a = stream_a_->snapshot();
  StreamSnapshot b = stream_b_->snapshot();

  SyncedSnapshot synced;
  const long dp =
      static_cast<long>(b.pulse_id) - static_cast<long>(a.pulse_id);
  synced.pulse_id = std::min(a.pulse_id, b.pulse_id);
  latest_synced_pulse_id_ = synced.pulse_id;

  // already synced
  if (dp == 0) {
    synced.rows[0] = std::move(a.buffer);
    synced.rows[1] = std::move(b.buffer);
    return synced;
  }

  const double ticks = stream_a_->ticks_per_sample();
  const double modulus = stream_a_->buffer_modulus();
  if (!std::isfinite(ticks) || !std::isfinite(modulus) || ticks <= 0.0) {
    synced_point_count_ = 0;
    return synced;
  }

  // offset > 0 means stream A lags stream B and vice-versa
  const long offset = resolve_shot_offset(dp, ticks, modulus);
  const size_t shift = static_cast<size_t>(std::labs(offset));
  const size_t length = std::min(a.buffer.size(), b.buffer.size());

  if (shift >= length) {
    synced_point_count_ = 0;
    return synced;
  }

  const size_t n = length - shift;
  synced_point_count_ = static_cast<long>(n);

  if (offset > 0) {
    synced.rows[0].assign(a.buffer.end() - static_cast<std::ptrdiff_t>(n),
                          a.buffer.end());
    synced.rows[1].assign(b.buffer.begin(),
                          b.buffer.begin() + static_cast<std::ptrdiff_t>(n));
  } else if (offset < 0) {
    synced.rows[0].assign(a.buffer.begin(),
                          a.buffer.begin() + static_cast<std::ptrdiff_t>(n));
    synced.rows[1].assign(b.buffer.end() - static_cast<std::ptrdiff_t>(n),
                          b.buffer.end());
  } else {
    // pulse IDs differ by less than one sample
    synced.rows[0] = std::move(a.buffer);
    synced.rows[1] = std::move(b.buffer);
  }

  return synced;
}

// ----------------------------- Timing ---------------------------------------

double DualBSAStreamBuffer::sample_rate() const {
  std::lock_guard<std::mutex> lock(streams_mutex_);
  return stream_a_->sample_rate();
}

double DualBSAStreamBuffer::sample_spacing() const {
  std::lock_guard<std::mutex> lock(streams_mutex_);
  return stream_a_->sample_spacing();
}

double DualBSAStreamBuffer::ticks_per_sample() const {
  std::lock_guard<std::mutex> lock(streams_mutex_);
  return stream_a_->ticks_per_sample();
}

double DualBSAStreamBuffer::buffer_modulus() const {
  std::lock_guard<std::mutex> lock(streams_mutex_);
  return stream_a_->buffer_modulus();
}

}  // namespace rt_bsa
