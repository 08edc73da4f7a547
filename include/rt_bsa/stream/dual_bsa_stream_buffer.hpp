/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#pragma once

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "rt_bsa/stream/bsa_stream_buffer.hpp"

namespace rt_bsa {

struct DualStreamConfig {
  std::string ch1;
  std::string ch2;
  Beamline beamline{Beamline::NC_HXR};
};

/**
 * @brief Time-aligned pair of buffers, rows[0] from ch1 and rows[1] from ch2
 */
struct SyncedSnapshot {
  std::array<std::vector<double>, 2> rows;
  PulseId pulse_id{0};

  size_t size() const { return rows[0].size(); }
  bool empty() const { return rows[0].empty(); }
};

/**
 * @brief Paired, synchronized BSA data for two channels on one beamline
 *
 * Streams both channels with two BSAStreamBuffers and synchronizes them on
 * request. Only the overlap of N <= 2800 samples that share pulse IDs is
 * returned. The two snapshots are taken one after the other without a
 * common lock, so they may be up to one update apart.
 */
class DualBSAStreamBuffer {
 public:
  DualBSAStreamBuffer(TelemetrySource& source, const DualStreamConfig& config,
                      std::shared_ptr<GapMonitor> gap_monitor = nullptr);
  ~DualBSAStreamBuffer();

  DualBSAStreamBuffer(const DualBSAStreamBuffer&) = delete;
  DualBSAStreamBuffer& operator=(const DualBSAStreamBuffer&) = delete;

  /**
   * @brief Align the latest snapshots of both streams
   * @return Two equal-length rows and the latest synced pulse ID; empty rows
   *         if the streams are too far apart or the rate is undefined
   */
  SyncedSnapshot align();

  /// Tear down and rebuild both streams. Init failures only warn.
  void reconfigure(const DualStreamConfig& config);
  void set_ch1(const std::string& channel);
  void set_ch2(const std::string& channel);
  void set_beamline(Beamline beamline);
  void set_beamline(const std::string& beamline);

  void stop();

  const std::string& ch1() const { return config_.ch1; }
  const std::string& ch2() const { return config_.ch2; }
  Beamline beamline() const { return config_.beamline; }

  /// Number of synced points from the last misaligned align(), -1 before any
  long synced_point_count() const { return synced_point_count_; }
  PulseId latest_synced_pulse_id() const { return latest_synced_pulse_id_; }

  // Timing constants, shared with stream A
  double sample_rate() const;
  double sample_spacing() const;
  double ticks_per_sample() const;
  double buffer_modulus() const;

  const BSAStreamBuffer& stream_a() const { return *stream_a_; }
  const BSAStreamBuffer& stream_b() const { return *stream_b_; }

 private:
  static void validate(const DualStreamConfig& config);
  void build_streams(bool raise_on_failure);

 private:
  TelemetrySource& source_;
  DualStreamConfig config_;
  std::shared_ptr<GapMonitor> gap_monitor_;

  // Serializes align() against reconfiguration
  mutable std::mutex streams_mutex_;
  std::unique_ptr<BSAStreamBuffer> stream_a_;
  std::unique_ptr<BSAStreamBuffer> stream_b_;

  std::atomic<long> synced_point_count_{-1};
  std::atomic<PulseId> latest_synced_pulse_id_{0};
};

}  // namespace rt_bsa
