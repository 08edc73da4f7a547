/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "rt_bsa/stream/pulse_id.hpp"

namespace rt_bsa {

/**
 * @brief One detected run of missed pulses on a stream
 */
struct MissedPulseEvent {
  std::string channel;
  long missed;            // number of NaN-padded samples
  PulseId previous_id;    // last pulse ID before the gap
  PulseId new_id;         // pulse ID that revealed the gap
};

/**
 * @brief Per-channel gap statistics
 */
struct ChannelGapStats {
  std::string channel;
  uint64_t gap_events;                   // Number of reported gaps
  uint64_t missed_pulses;                // Sum of missed pulses over all gaps
  long largest_gap;                      // Largest single gap (pulses)
  PulseId last_previous_id;              // Pulse IDs of the latest gap
  PulseId last_new_id;
  std::chrono::steady_clock::time_point last_update;  // Last gap time

  ChannelGapStats()
      : gap_events(0),
        missed_pulses(0),
        largest_gap(0),
        last_previous_id(0),
        last_new_id(0) {}
};

/**
 * @brief Observability sink for missed-pulse events
 *
 * Streams report every detected gap here. Gaps are informational: the
 * monitor only counts them and, when verbose, prints one line per event.
 *
 * Thread-safe design allows reports from several delivery threads.
 */
class GapMonitor {
 public:
  /**
   * @brief Constructor
   * @param verbose Print a line for every reported gap
   */
  explicit GapMonitor(bool verbose = true);

  ~GapMonitor() = default;

  /**
   * @brief Record a missed-pulse event
   * @param event Gap description from the stream
   */
  void record_missed(const MissedPulseEvent& event);

  /**
   * @brief Get statistics for one channel
   * @return Channel statistics, or empty stats if the channel never reported
   */
  ChannelGapStats get_channel_stats(const std::string& channel) const;

  std::map<std::string, ChannelGapStats> get_all_stats() const;

  /**
   * @brief Reset statistics for one channel, or for all with an empty name
   */
  void reset_stats(const std::string& channel = "");

  /**
   * @brief Generate a human-readable statistics report
   */
  std::string generate_report() const;

  void set_verbose(bool verbose);
  bool is_verbose() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, ChannelGapStats> channel_stats_;
  std::atomic<bool> verbose_;
  std::atomic<bool> enabled_;
};

}  // namespace rt_bsa
