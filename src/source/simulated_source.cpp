/**************************************************
 * Copyright (c) 2025 Wenbo Li
 * University of Science and Technology of China
 *
 * This file is part of the RT-BSA project.
 * Distributed under the MIT License.
 **************************************************/

#include "rt_bsa/source/simulated_source.hpp"

#include <chrono>
#include <iostream>
#include <vector>

namespace rt_bsa {

SimulatedSource::SimulatedSource(size_t queue_depth) : fifo_(queue_depth) {
  enable_delivery_thread();
}

SimulatedSource::~SimulatedSource() { disable_delivery_thread(); }

// ----------------------------- Thread Controls ------------------------------

bool SimulatedSource::enable_delivery_thread() {
  if (delivery_thread_running_) return true;
  delivery_thread_running_ = true;
  delivery_thread_ = std::thread(&SimulatedSource::deliveryThread, this);
  return true;
}

void SimulatedSource::disable_delivery_thread() {
  if (!delivery_thread_running_) return;
  delivery_thread_running_ = false;
  if (delivery_thread_.joinable()) delivery_thread_.join();
}

// ----------------------------- Channel Setup --------------------------------

void SimulatedSource::add_channel(const std::string& address) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  channels_.insert(address);
}

void SimulatedSource::set_history(const std::string& address,
                                  const HistoryBuffer& history) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  histories_[address] = history;
}

void SimulatedSource::set_rate(const std::string& address, double rate) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  rates_[address] = rate;
}

// ----------------------------- Publishing -----------------------------------

void SimulatedSource::publish_value(const std::string& address, double value,
                                    uint64_t nanoseconds) {
  TelemetryEvent event;
  event.kind = TelemetryEvent::Kind::VALUE;
  event.address = address;
  event.value = value;
  event.nanoseconds = nanoseconds;
  enqueue(event);
}

void SimulatedSource::publish_rate(const std::string& address, double rate) {
  set_rate(address, rate);

  TelemetryEvent event;
  event.kind = TelemetryEvent::Kind::RATE;
  event.address = address;
  event.value = rate;
  enqueue(event);
}

void SimulatedSource::enqueue(const TelemetryEvent& event) {
  ++pending_;
  if (fifo_.push(event)) {
    // an older event was dropped and will never be delivered
    --pending_;
  }
}

bool SimulatedSource::flush(int timeout_ms) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (pending_.load() != 0) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::microseconds(200));
  }
  return true;
}

size_t SimulatedSource::subscription_count(const std::string& address) const {
  std::lock_guard<std::mutex> lock(subs_mutex_);
  size_t n = 0;
  for (const auto& [handle, sub] : subs_) {
    if (sub.address == address) ++n;
  }
  return n;
}

// ----------------------------- TelemetrySource ------------------------------

HistoryBuffer SimulatedSource::fetch_history(const std::string& address) {
  if (fail_history_) {
    throw TelemetrySourceException("history fetch failed for " + address);
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto it = histories_.find(address);
  if (it == histories_.end()) {
    throw TelemetrySourceException("no history buffer " + address);
  }
  return it->second;
}

double SimulatedSource::read_rate(const std::string& address) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto it = rates_.find(address);
  if (it == rates_.end()) {
    throw TelemetrySourceException("no rate source " + address);
  }
  return it->second;
}

SubscriptionHandle SimulatedSource::subscribe(const std::string& address,
                                              ValueCallback on_value) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (channels_.find(address) == channels_.end()) {
      throw TelemetrySourceException("failed to connect to " + address);
    }
  }
  std::lock_guard<std::mutex> lock(subs_mutex_);
  SubscriptionHandle handle = next_handle_++;
  subs_[handle] = Subscription{TelemetryEvent::Kind::VALUE, address,
                               std::move(on_value), nullptr};
  return handle;
}

SubscriptionHandle SimulatedSource::subscribe_rate(const std::string& address,
                                                   RateCallback on_rate) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (rates_.find(address) == rates_.end()) {
      throw TelemetrySourceException("failed to connect to " + address);
    }
  }
  std::lock_guard<std::mutex> lock(subs_mutex_);
  SubscriptionHandle handle = next_handle_++;
  subs_[handle] = Subscription{TelemetryEvent::Kind::RATE, address, nullptr,
                               std::move(on_rate)};
  return handle;
}

void SimulatedSource::unsubscribe(SubscriptionHandle handle) {
  if (handle == kInvalidSubscription) return;
  {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    subs_.erase(handle);
  }
  // From inside a callback the delivery thread already holds dispatch_mutex_
  if (std::this_thread::get_id() == delivery_thread_.get_id()) return;

  // Wait for an in-flight dispatch that may still hold the old callback
  std::lock_guard<std::mutex> lock(dispatch_mutex_);
}

// ----------------------------- Delivery Thread ------------------------------
// pop event -> copy matching callbacks -> invoke outside subs_mutex_
void SimulatedSource::deliveryThread() {
  while (delivery_thread_running_) {
    TelemetryEvent event;
    if (!fifo_.wait_and_pop(event, 20)) {
      continue;
    }
    dispatch(event);
    ++delivered_;
    --pending_;
  }
}

void SimulatedSource::dispatch(const TelemetryEvent& event) {
  std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);

  std::vector<Subscription> targets;
  {
    std::lock_guard<std::mutex> lock(subs_mutex_);
    for (const auto& [handle, sub] : subs_) {
      if (sub.kind == event.kind && sub.address == event.address) {
        targets.push_back(sub);
      }
    }
  }

  for (const auto& sub : targets) {
    try {
      if (sub.kind == TelemetryEvent::Kind::VALUE && sub.on_value) {
        sub.on_value(event.value, event.nanoseconds);
      } else if (sub.kind == TelemetryEvent::Kind::RATE && sub.on_rate) {
        sub.on_rate(event.value);
      }
    } catch (const std::exception& e) {
      std::cerr << "[SimSource] WARNING: callback for " << event.address
                << " threw: " << e.what() << std::endl;
    }
  }
}

}  // namespace rt_bsa
