/**************************************************
 * Sample Ring Buffer - Implementation
 *
 * (Separated from header for clean build structure)
 **************************************************/

#include "rt_bsa/stream/sample_ring_buffer.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <limits>

namespace rt_bsa {

namespace {
const double kNaN = std::numeric_limits<double>::quiet_NaN();
}

// ---- Constructor ----
SampleRingBuffer::SampleRingBuffer(size_t capacity)
    : cap_(std::max<size_t>(capacity, 1)),
      buf_(cap_, kNaN),
      head_(0),
      padded_samples_(0) {}

// ---- Basic info ----
size_t SampleRingBuffer::capacity() const { return cap_; }

void SampleRingBuffer::clear() {
  std::fill(buf_.begin(), buf_.end(), kNaN);
  head_ = 0;
}

// ---- Bulk replace ----
void SampleRingBuffer::assign(const std::vector<double>& values) {
  clear();
  const size_t n = std::min(values.size(), cap_);
  const size_t pad = cap_ - n;
  std::copy(values.end() - static_cast<std::ptrdiff_t>(n), values.end(),
            buf_.begin() + static_cast<std::ptrdiff_t>(pad));
}

// ---- Push ----
void SampleRingBuffer::push(double value) {
  buf_[head_ % cap_] = value;
  ++head_;
}

// ---- Gap padding ----
void SampleRingBuffer::shift_nan(size_t n) {
  const size_t count = std::min(n, cap_);
  for (size_t i = 0; i < count; ++i) {
    buf_[head_ % cap_] = kNaN;
    ++head_;
  }
  padded_samples_ += count;
}

// ---- Random access (0 = oldest) ----
double SampleRingBuffer::at(size_t index) const {
  if (index >= cap_) return kNaN;
  return buf_[(head_ + index) % cap_];
}

double SampleRingBuffer::newest() const { return at(cap_ - 1); }

std::vector<double> SampleRingBuffer::to_vector() const {
  std::vector<double> out;
  out.reserve(cap_);
  const size_t start = head_ % cap_;
  out.insert(out.end(), buf_.begin() + static_cast<std::ptrdiff_t>(start),
             buf_.end());
  out.insert(out.end(), buf_.begin(),
             buf_.begin() + static_cast<std::ptrdiff_t>(start));
  return out;
}

void SampleRingBuffer::show(size_t last_n) const {
  const size_t n = std::min(last_n, cap_);
  std::cout << "SampleRingBuffer newest " << n << " of " << cap_ << ": ";
  std::cout << std::setprecision(6);
  for (size_t i = cap_ - n; i < cap_; ++i) {
    std::cout << at(i) << " ";
  }
  std::cout << std::endl;
}

}  // namespace rt_bsa
