// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 PortAllocator - hands out host ports from a fixed inclusive range

 Purpose
 - Give every container-internal port a distinct host port to bind to
 - Allow concurrent orchestration runs to share one pool of host ports

 Key properties
 1. A leased port is exclusively owned by its holder until Release()
 2. Lease() and Release() are serialized by one mutex, so the
    check-and-mark step can never hand the same port to two callers
 3. Release() is idempotent; unleased or out-of-range ports are ignored
 4. No ordering guarantee: leases rotate through the range, so callers must
    not assume monotonic ports
*/

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <set>

namespace svcnet {
namespace network {

class PortAllocator {
public:
  /**
   * @param range_start First port of the range (inclusive, >= 1)
   * @param range_end Last port of the range (inclusive, >= range_start)
   * @throws std::invalid_argument if the range is empty or starts at 0
   */
  PortAllocator(uint16_t range_start, uint16_t range_end);
  ~PortAllocator() = default;

  // Non-copyable (owns a mutex and the lease table)
  PortAllocator(const PortAllocator&) = delete;
  PortAllocator& operator=(const PortAllocator&) = delete;

  /**
   * Lease a free port from the range
   * @throws PortRangeExhausted if every port in the range is leased
   */
  uint16_t Lease();

  /**
   * Return a port to the pool (no-op if it was not leased)
   */
  void Release(uint16_t port);

  bool IsLeased(uint16_t port) const;
  bool InRange(uint16_t port) const {
    return port >= range_start_ && port <= range_end_;
  }

  size_t Capacity() const {
    return static_cast<size_t>(range_end_) - range_start_ + 1;
  }
  size_t LeasedCount() const;
  size_t AvailableCount() const;

  uint16_t range_start() const { return range_start_; }
  uint16_t range_end() const { return range_end_; }

private:
  const uint16_t range_start_;
  const uint16_t range_end_;

  mutable std::mutex mutex_;
  std::set<uint16_t> leased_;   // GUARDED_BY mutex_
  uint16_t next_candidate_;     // GUARDED_BY mutex_; where the next scan starts
};

} // namespace network
} // namespace svcnet
