/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#pragma once

#include <cstddef>
#include <cstdint>

namespace rt_bsa {

/// 14-bit pulse identifier, taken from the low bits of the nanoseconds field
using PulseId = uint32_t;

constexpr uint32_t kPulseIdBits = 14;
constexpr uint32_t kPulseIdModulus = 1u << kPulseIdBits;  // 16384
constexpr uint32_t kPulseIdMask = kPulseIdModulus - 1;    // 0x3FFF

/// Pulse ID tick rate (Hz)
constexpr double kFiducialRate = 360.0;

/// Number of samples held by every BSA buffer
constexpr size_t kBufferLength = 2800;

/// Extract the pulse ID from a BSA timestamp nanoseconds field
PulseId ns_to_pulse_id(uint64_t nanoseconds);

/// Fold a (possibly negative or fractional) pulse position into [0, 2^14)
double wrap_pulse_id(double pulse_id);

/**
 * @brief Signed shortest distance from `from` to `to` on the 2^14 ring
 * @return value in (-8192, 8192]
 */
double pulse_id_delta(double from, double to);

/**
 * @brief Resolve the shot offset between two streams from their pulse ID delta
 *
 * The raw shot delta is trunc(dp / ticks_per_sample). Because pulse IDs wrap
 * after `buffer_modulus` shots, raw - modulus and raw + modulus describe the
 * same lag; the interpretation with the smallest magnitude wins and keeps
 * its own sign.
 *
 * @param dp Raw pulse ID difference (stream B minus stream A)
 * @param ticks_per_sample Pulse ID increment per buffer update (finite, > 0)
 * @param buffer_modulus Shots counted before the pulse ID rolls over
 * @return Signed offset in samples; > 0 means stream A lags stream B
 */
long resolve_shot_offset(long dp, double ticks_per_sample,
                         double buffer_modulus);

}  // namespace rt_bsa
