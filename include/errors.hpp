// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Error taxonomy

 Every failure raised by the orchestration core derives from
 OrchestrationError so callers can catch the whole family at once.

 - InvalidDependency:       AddService referenced an unregistered id
 - PortRangeExhausted:      no free host port left in the configured range
 - ContainerLaunchFailed:   runtime could not create or start a container
 - ContainerInspectFailed:  runtime could not report a container's address
 - ContainerTeardownFailed: runtime could not stop or remove a container
 - ConfigError:             network description file is malformed

 ServiceStartFailed carries a partial RunningNetwork and is declared next to
 it in orchestrator/network_orchestrator.hpp.
*/

#include <cstdint>
#include <stdexcept>
#include <string>

namespace svcnet {

class OrchestrationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class InvalidDependency : public OrchestrationError {
public:
  explicit InvalidDependency(const std::string &message)
      : OrchestrationError(message) {}
};

class PortRangeExhausted : public OrchestrationError {
public:
  PortRangeExhausted(uint16_t range_start, uint16_t range_end)
      : OrchestrationError("No free host port left in range [" +
                           std::to_string(range_start) + ", " +
                           std::to_string(range_end) + "]"),
        range_start_(range_start), range_end_(range_end) {}

  uint16_t range_start() const { return range_start_; }
  uint16_t range_end() const { return range_end_; }

private:
  uint16_t range_start_;
  uint16_t range_end_;
};

class ContainerLaunchFailed : public OrchestrationError {
public:
  explicit ContainerLaunchFailed(const std::string &message)
      : OrchestrationError(message) {}
};

class ContainerInspectFailed : public OrchestrationError {
public:
  explicit ContainerInspectFailed(const std::string &message)
      : OrchestrationError(message) {}
};

class ContainerTeardownFailed : public OrchestrationError {
public:
  explicit ContainerTeardownFailed(const std::string &message)
      : OrchestrationError(message) {}
};

class ConfigError : public OrchestrationError {
public:
  explicit ConfigError(const std::string &message)
      : OrchestrationError(message) {}
};

} // namespace svcnet
