#include <atomic>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <rt_bsa/source/simulated_source.hpp>
#include <rt_bsa/stream/dual_bsa_stream_buffer.hpp>

namespace {
// Simulated 120 Hz timing system: low 14 bits of the timestamp carry the
// pulse ID
uint64_t timestamp_for(rt_bsa::PulseId pulse_id) {
  return (static_cast<uint64_t>(0x5A5A) << rt_bsa::kPulseIdBits) | pulse_id;
}

rt_bsa::HistoryBuffer make_history(rt_bsa::PulseId newest, double scale) {
  rt_bsa::HistoryBuffer history;
  history.values.resize(rt_bsa::kBufferLength);
  for (size_t i = 0; i < rt_bsa::kBufferLength; ++i) {
    history.values[i] = scale * std::sin(0.01 * static_cast<double>(i));
  }
  history.nanoseconds = timestamp_for(newest);
  return history;
}
}  // namespace

int main() {
  const rt_bsa::Beamline beamline = rt_bsa::Beamline::NC_HXR;
  const rt_bsa::BeamlineInfo& info = rt_bsa::beamline_info(beamline);
  const std::string ch1 = info.default_ch1;
  const std::string ch2 = info.default_ch2;
  try {
    std::cout << "=== RT-BSA Demo ===" << std::endl;
    std::cout << "This demo shows the DualBSAStreamBuffer API functionality"
              << std::endl;

    // Set up the simulated control system
    std::cout << "Initializing simulated source..." << std::endl;
    rt_bsa::SimulatedSource source;
    const double rate = 120.0;
    const uint32_t ticks = static_cast<uint32_t>(rt_bsa::kFiducialRate / rate);
    rt_bsa::PulseId pulse_id = 8000;

    source.add_channel(ch1);
    source.add_channel(ch2);
    source.set_rate(info.rate_address, rate);
    source.set_history(rt_bsa::history_address(ch1, beamline, rate),
                       make_history(pulse_id, 1.0));
    source.set_history(rt_bsa::history_address(ch2, beamline, rate),
                       make_history(pulse_id, 2.0));

    // Start streaming both channels
    std::cout << "\n=== Starting " << info.name << " streams ===" << std::endl;
    auto monitor = std::make_shared<rt_bsa::GapMonitor>();
    rt_bsa::DualBSAStreamBuffer dual(
        source, rt_bsa::DualStreamConfig{ch1, ch2, beamline}, monitor);

    std::cout << "Rate: " << dual.sample_rate()
              << " Hz, ticks/sample: " << dual.ticks_per_sample()
              << ", buffer modulus: " << dual.buffer_modulus() << std::endl;

    // Feed both channels at 120 Hz; ch2 occasionally misses a pulse
    std::atomic<bool> feeding(true);
    std::thread feeder([&, pulse_id]() mutable {
      std::mt19937 rng(7);
      std::bernoulli_distribution miss(0.1);
      auto next = std::chrono::steady_clock::now();
      size_t k = 0;
      while (feeding.load()) {
        next += std::chrono::microseconds(8333);
        pulse_id = (pulse_id + ticks) & rt_bsa::kPulseIdMask;
        const double t =
            0.01 * static_cast<double>(rt_bsa::kBufferLength + k++);
        source.publish_value(ch1, std::sin(t), timestamp_for(pulse_id));
        if (!miss(rng)) {
          source.publish_value(ch2, 2.0 * std::sin(t),
                               timestamp_for(pulse_id));
        }
        std::this_thread::sleep_until(next);
      }
    });

    for (int i = 0; i < 10; i++) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      rt_bsa::SyncedSnapshot synced = dual.align();

      // set print format
      std::cout << std::fixed << std::setprecision(4);
      std::cout << std::left;

      // print table header
      std::cout << std::setw(12) << "Pulse ID" << std::setw(12) << "Points"
                << std::setw(14) << "Newest ch1" << std::setw(14)
                << "Newest ch2" << std::setw(10) << "NaNs" << std::endl;

      // print separator line
      std::cout << std::string(62, '-') << std::endl;

      const double nan = std::numeric_limits<double>::quiet_NaN();
      size_t nans = 0;
      for (const auto& row : synced.rows) {
        for (double x : row) {
          if (std::isnan(x)) ++nans;
        }
      }
      std::cout << std::setw(12) << synced.pulse_id << std::setw(12)
                << synced.size() << std::setw(14)
                << (synced.empty() ? nan : synced.rows[0].back())
                << std::setw(14)
                << (synced.empty() ? nan : synced.rows[1].back())
                << std::setw(10) << nans << std::endl;

      // print separator line
      std::cout << std::string(62, '-') << std::endl << std::endl;
    }

    feeding.store(false);
    feeder.join();

    std::cout << monitor->generate_report() << std::endl;
    dual.stop();
  } catch (const std::exception& e) {
    std::cerr << "[RT-BSA Exception]: " << info.name << " [" << ch1 << ", "
              << ch2 << "]>> " << e.what() << std::endl;
    return -1;
  }
  return 0;
}
