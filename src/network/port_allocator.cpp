// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/port_allocator.hpp"
#include "errors.hpp"
#include "util/logging.hpp"
#include <stdexcept>
#include <string>

namespace svcnet {
namespace network {

PortAllocator::PortAllocator(uint16_t range_start, uint16_t range_end)
    : range_start_(range_start), range_end_(range_end),
      next_candidate_(range_start) {
  if (range_start == 0) {
    throw std::invalid_argument("Port range must not start at 0");
  }
  if (range_start > range_end) {
    throw std::invalid_argument("Invalid port range: " + std::to_string(range_start) +
                                " > " + std::to_string(range_end));
  }
}

uint16_t PortAllocator::Lease() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (leased_.size() >= Capacity()) {
    LOG_ORCH_WARN("PortAllocator: range [{}, {}] exhausted ({} leased)",
                  range_start_, range_end_, leased_.size());
    throw PortRangeExhausted(range_start_, range_end_);
  }

  // Rotate through the range starting at the cursor; capacity check above
  // guarantees at least one free port is found within one full pass.
  uint16_t candidate = next_candidate_;
  for (size_t scanned = 0; scanned < Capacity(); ++scanned) {
    if (leased_.count(candidate) == 0) {
      leased_.insert(candidate);
      next_candidate_ = (candidate == range_end_) ? range_start_
                                                  : static_cast<uint16_t>(candidate + 1);
      LOG_ORCH_TRACE("PortAllocator: leased port {}", candidate);
      return candidate;
    }
    candidate = (candidate == range_end_) ? range_start_
                                          : static_cast<uint16_t>(candidate + 1);
  }

  throw PortRangeExhausted(range_start_, range_end_);
}

void PortAllocator::Release(uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (leased_.erase(port) > 0) {
    LOG_ORCH_TRACE("PortAllocator: released port {}", port);
  }
}

bool PortAllocator::IsLeased(uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return leased_.count(port) > 0;
}

size_t PortAllocator::LeasedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return leased_.size();
}

size_t PortAllocator::AvailableCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Capacity() - leased_.size();
}

} // namespace network
} // namespace svcnet
