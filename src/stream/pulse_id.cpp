/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#include "rt_bsa/stream/pulse_id.hpp"

#include <cmath>
#include <cstdlib>

namespace rt_bsa {

PulseId ns_to_pulse_id(uint64_t nanoseconds) {
  return static_cast<PulseId>(nanoseconds & kPulseIdMask);
}

double wrap_pulse_id(double pulse_id) {
  const double modulus = static_cast<double>(kPulseIdModulus);
  double wrapped = std::fmod(pulse_id, modulus);
  if (wrapped < 0.0) wrapped += modulus;
  return wrapped;
}

double pulse_id_delta(double from, double to) {
  const double modulus = static_cast<double>(kPulseIdModulus);
  double d = wrap_pulse_id(to) - wrap_pulse_id(from);
  if (d > modulus / 2.0) {
    d -= modulus;
  } else if (d <= -modulus / 2.0) {
    d += modulus;
  }
  return d;
}

long resolve_shot_offset(long dp, double ticks_per_sample,
                         double buffer_modulus) {
  const long raw = static_cast<long>(
      std::trunc(static_cast<double>(dp) / ticks_per_sample));
  const long modulus = static_cast<long>(buffer_modulus);

  // raw + modulus covers a negative dp that crossed the rollover
  const long candidates[] = {raw, raw - modulus, raw + modulus};
  long best = raw;
  for (long c : candidates) {
    if (std::labs(c) < std::labs(best)) best = c;
  }
  return best;
}

}  // namespace rt_bsa
