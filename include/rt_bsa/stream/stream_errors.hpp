/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#pragma once

#include <stdexcept>
#include <string>

namespace rt_bsa {

/**
 * @brief Invalid beamline or channel definition
 */
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg)
      : std::runtime_error("BSA configuration error: " + msg) {}
};

/**
 * @brief Subscription or history fetch failed while (re)initializing a stream
 */
class StreamInitError : public std::runtime_error {
 public:
  explicit StreamInitError(const std::string& msg)
      : std::runtime_error("BSA stream init error: " + msg) {}
};

}  // namespace rt_bsa
