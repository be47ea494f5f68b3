// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace svcnet {
namespace orchestrator {

// Handle for a logical service, assigned sequentially from 0 by the builder
using ServiceId = int;

// Services that must be started before a given service
using DependencySet = std::set<ServiceId>;

// Address other containers use to reach a service's primary RPC port
struct ServiceSocket {
  std::string ip_address;
  uint16_t port{0};

  std::string ToString() const { return ip_address + ":" + std::to_string(port); }

  bool operator<(const ServiceSocket &other) const {
    return std::tie(ip_address, port) < std::tie(other.ip_address, other.port);
  }
  bool operator==(const ServiceSocket &other) const {
    return ip_address == other.ip_address && port == other.port;
  }
};

// JSON-RPC call that tells whether a service is live.
// The orchestration core only forwards it; containers and LivenessChecker
// interpret it.
struct JsonRpcRequest {
  std::string method;
  nlohmann::json params = nlohmann::json::object();
  std::string path{"/"};  // HTTP path the request is POSTed to

  bool operator==(const JsonRpcRequest &other) const {
    return method == other.method && params == other.params && path == other.path;
  }
};

using LivenessProbe = JsonRpcRequest;

// Dependency endpoint -> that dependency's liveness probe
using DependencyProbes = std::map<ServiceSocket, LivenessProbe>;

// Who a container is, as seen by its own start command
struct ServiceIdentity {
  ServiceId id{0};
  std::string hostname;
};

// ServiceDefinition - what to run for one logical service.
// Implementations are owned by the caller and shared read-only with every
// graph snapshot that references them, so all methods are const.
class ServiceDefinition {
public:
  virtual ~ServiceDefinition() = default;

  virtual std::string GetImage() const = 0;

  // Container-internal port serving JSON-RPC
  virtual uint16_t GetPrimaryPort() const = 0;

  // Other container-internal ports to publish (may be empty)
  virtual std::vector<uint16_t> GetAdditionalPorts() const = 0;

  virtual LivenessProbe GetLivenessProbe() const = 0;

  // Command tokens for the container. `dependencies` maps each dependency's
  // endpoint to its liveness probe so the container can wait for them itself.
  virtual std::vector<std::string>
  RenderStartCommand(const ServiceIdentity &identity,
                     const DependencyProbes &dependencies) const = 0;
};

} // namespace orchestrator
} // namespace svcnet
