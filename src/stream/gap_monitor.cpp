/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#include <rt_bsa/stream/gap_monitor.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>

namespace rt_bsa {

// ============================================================================
// GapMonitor Implementation
// ============================================================================

GapMonitor::GapMonitor(bool verbose) : verbose_(verbose), enabled_(true) {}

void GapMonitor::record_missed(const MissedPulseEvent& event) {
  if (!enabled_ || event.missed <= 0) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);

    ChannelGapStats& stats = channel_stats_[event.channel];
    stats.channel = event.channel;
    stats.gap_events++;
    stats.missed_pulses += static_cast<uint64_t>(event.missed);
    if (event.missed > stats.largest_gap) {
      stats.largest_gap = event.missed;
    }
    stats.last_previous_id = event.previous_id;
    stats.last_new_id = event.new_id;
    stats.last_update = std::chrono::steady_clock::now();
  }

  if (verbose_) {
    std::cout << "[GapMonitor] " << event.channel << " missed " << event.missed
              << " pulses: " << event.previous_id << "->" << event.new_id
              << std::endl;
  }
}

ChannelGapStats GapMonitor::get_channel_stats(const std::string& channel) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = channel_stats_.find(channel);
  if (it != channel_stats_.end()) {
    return it->second;
  }

  ChannelGapStats empty;
  empty.channel = channel;
  return empty;
}

std::map<std::string, ChannelGapStats> GapMonitor::get_all_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channel_stats_;
}

void GapMonitor::reset_stats(const std::string& channel) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (channel.empty()) {
    channel_stats_.clear();
  } else {
    channel_stats_.erase(channel);
  }
}

std::string GapMonitor::generate_report() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::ostringstream oss;
  oss << "\n========================================\n";
  oss << "       BSA Stream Gap Statistics        \n";
  oss << "========================================\n\n";

  if (channel_stats_.empty()) {
    oss << "No gaps recorded.\n";
    return oss.str();
  }

  oss << std::left << std::setw(36) << "Channel" << std::setw(10) << "Gaps"
      << std::setw(12) << "Missed" << std::setw(10) << "Largest"
      << "Last (old->new)\n";
  oss << std::string(84, '-') << "\n";

  uint64_t total_events = 0;
  uint64_t total_missed = 0;

  for (const auto& [channel, stats] : channel_stats_) {
    std::ostringstream ids;
    ids << stats.last_previous_id << "->" << stats.last_new_id;
    oss << std::left << std::setw(36) << channel << std::setw(10)
        << stats.gap_events << std::setw(12) << stats.missed_pulses
        << std::setw(10) << stats.largest_gap << ids.str() << "\n";

    total_events += stats.gap_events;
    total_missed += stats.missed_pulses;
  }

  oss << std::string(84, '-') << "\n";
  oss << "Total gaps: " << total_events << ", missed pulses: " << total_missed
      << "\n";

  return oss.str();
}

void GapMonitor::set_verbose(bool verbose) { verbose_ = verbose; }

bool GapMonitor::is_verbose() const { return verbose_; }

void GapMonitor::set_enabled(bool enabled) { enabled_ = enabled; }

bool GapMonitor::is_enabled() const { return enabled_; }

}  // namespace rt_bsa
