// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace svcnet {
namespace runtime {

// Everything a runtime needs to launch one service container
struct ContainerSpec {
  std::string hostname;
  std::string image;
  std::vector<uint16_t> exposed_ports;             // container-internal, TCP
  std::map<uint16_t, uint16_t> port_bindings;      // internal port -> host port
  std::vector<std::string> command;
};

// Abstract container runtime interface
// Allows dependency injection of different implementations:
// - DockerRuntime: Docker Engine API over its Unix socket
// - MockRuntime: in-memory fake for testing (in test/)
//
// All calls block until the runtime has answered.
class ContainerRuntime {
public:
  virtual ~ContainerRuntime() = default;

  // Create and start a container; returns its id.
  // @throws ContainerLaunchFailed
  virtual std::string CreateAndStart(const ContainerSpec &spec) = 0;

  // Network address of a running container
  // @throws ContainerInspectFailed
  virtual std::string Inspect(const std::string &container_id) = 0;

  // Stop a container (already stopped is not an error)
  // @throws ContainerTeardownFailed
  virtual void Stop(const std::string &container_id) = 0;

  // Remove a container (already removed is not an error)
  // @throws ContainerTeardownFailed
  virtual void Remove(const std::string &container_id) = 0;
};

} // namespace runtime
} // namespace svcnet
