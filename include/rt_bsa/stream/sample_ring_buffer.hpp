/**************************************************
 * Sample Ring Buffer for BSA history streams
 *
 * - Fixed length (always full), oldest-first / newest-last
 * - O(1) push, O(n) NaN gap shift, wrap-around indexing
 * - Not synchronized: owner guards it (see BSAStreamBuffer)
 *
 * Copyright (c) 2025
 * MIT License
 **************************************************/

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "rt_bsa/stream/pulse_id.hpp"

namespace rt_bsa {

/**
 * @brief Fixed-size circular buffer of BSA samples.
 *
 * - The buffer is always full; NaN marks a missing sample.
 * - push() evicts the oldest sample and appends a new one.
 * - shift_nan(n) evicts the n oldest samples and appends n NaN placeholders.
 */
class SampleRingBuffer {
 public:
  /// Construct a NaN-filled buffer of the given length
  explicit SampleRingBuffer(size_t capacity = kBufferLength);

  /// Number of samples (always equal to the construction length)
  size_t capacity() const;
  size_t size() const { return capacity(); }

  /// Reset every sample to NaN
  void clear();

  /// Replace the whole contents, oldest-first. Short input is NaN-padded at
  /// the front, long input keeps its newest samples.
  void assign(const std::vector<double>& values);

  /// Append one sample, evicting the oldest
  void push(double value);

  /// Evict the n oldest samples and append n NaN placeholders
  void shift_nan(size_t n);

  /// Sample at logical index (0 = oldest)
  double at(size_t index) const;

  /// Most recent sample
  double newest() const;

  /// Copy out in oldest-first order
  std::vector<double> to_vector() const;

  /// Number of NaN placeholders inserted by shift_nan()
  uint64_t padded_samples() const { return padded_samples_; }

  void show(size_t last_n = 16) const;

 private:
  size_t cap_;
  std::vector<double> buf_;

  // Logical index of the next write (monotonic increasing)
  size_t head_;

  uint64_t padded_samples_;
};

}  // namespace rt_bsa
