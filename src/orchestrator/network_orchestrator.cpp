// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "orchestrator/network_orchestrator.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace svcnet {
namespace orchestrator {

namespace {

// Host ports leased for one service; released again unless committed to a
// RunningService.
class PortLeaseGuard {
public:
  explicit PortLeaseGuard(network::PortAllocator &ports) : ports_(ports) {}
  ~PortLeaseGuard() {
    if (committed_) {
      return;
    }
    for (const auto &[internal_port, host_port] : bindings_) {
      ports_.Release(host_port);
    }
  }

  PortLeaseGuard(const PortLeaseGuard &) = delete;
  PortLeaseGuard &operator=(const PortLeaseGuard &) = delete;

  void LeaseFor(uint16_t internal_port) {
    if (bindings_.count(internal_port) > 0) {
      return;
    }
    bindings_[internal_port] = ports_.Lease();
  }

  const std::map<uint16_t, uint16_t> &bindings() const { return bindings_; }

  std::map<uint16_t, uint16_t> Commit() {
    committed_ = true;
    return bindings_;
  }

private:
  network::PortAllocator &ports_;
  std::map<uint16_t, uint16_t> bindings_;
  bool committed_{false};
};

// Primary port first, then additional ports, duplicates dropped
std::vector<uint16_t> ContainerPorts(const ServiceDefinition &definition) {
  std::vector<uint16_t> ports{definition.GetPrimaryPort()};
  for (uint16_t port : definition.GetAdditionalPorts()) {
    if (std::find(ports.begin(), ports.end(), port) == ports.end()) {
      ports.push_back(port);
    }
  }
  return ports;
}

} // namespace

ServiceStartFailed::ServiceStartFailed(ServiceId failed_service_id,
                                       const std::string &cause,
                                       RunningNetwork partial_network,
                                       std::exception_ptr cause_exception,
                                       std::string unconfirmed_container_id)
    : OrchestrationError("Failed to start service " +
                         std::to_string(failed_service_id) + ": " + cause),
      failed_service_id_(failed_service_id), cause_(cause),
      partial_network_(std::move(partial_network)),
      cause_exception_(std::move(cause_exception)),
      unconfirmed_container_id_(std::move(unconfirmed_container_id)) {}

NetworkOrchestrator::NetworkOrchestrator(runtime::ContainerRuntime &runtime,
                                         network::PortAllocator &ports,
                                         const Config &config)
    : runtime_(runtime), ports_(ports), config_(config) {}

std::string NetworkOrchestrator::HostnameFor(ServiceId id) const {
  return config_.hostname_prefix + std::to_string(id);
}

RunningNetwork NetworkOrchestrator::CreateAndRun(const ServiceGraph &graph) {
  LOG_ORCH_INFO("Starting network of {} services ({} terminal)", graph.Size(),
                graph.TerminalServiceIds().size());

  // Filled in start order, so every dependency's probe is known before its
  // dependents render their commands
  std::map<ServiceId, LivenessProbe> probes;

  RunningNetwork running(graph.TerminalServiceIds());
  for (ServiceId id : graph.StartOrder()) {
    std::string leftover_container;
    try {
      probes[id] = graph.GetDefinition(id).GetLivenessProbe();
      running.Add(StartService(graph, id, running, probes, leftover_container));
    } catch (const std::exception &e) {
      LOG_ORCH_ERROR("Service {} failed to start: {} ({} services left running)",
                     id, e.what(), running.Size());
      throw ServiceStartFailed(id, e.what(), running, std::current_exception(),
                               leftover_container);
    }
  }

  LOG_ORCH_INFO("All {} services started", running.Size());
  return running;
}

RunningService NetworkOrchestrator::StartService(
    const ServiceGraph &graph, ServiceId id, const RunningNetwork &running,
    const std::map<ServiceId, LivenessProbe> &probes,
    std::string &leftover_container) {
  const ServiceDefinition &definition = graph.GetDefinition(id);

  DependencyProbes dependencies;
  for (ServiceId dependency_id : graph.GetDependencies(id)) {
    // Present by construction: dependencies precede dependents in start order
    auto dependency = running.Get(dependency_id);
    if (!dependency) {
      throw std::logic_error("Dependency " + std::to_string(dependency_id) +
                             " is not running");
    }
    dependencies[dependency->endpoint] = probes.at(dependency_id);
  }

  PortLeaseGuard leases(ports_);
  std::vector<uint16_t> container_ports = ContainerPorts(definition);
  for (uint16_t internal_port : container_ports) {
    leases.LeaseFor(internal_port);
  }

  ServiceIdentity identity{id, HostnameFor(id)};

  runtime::ContainerSpec spec;
  spec.hostname = identity.hostname;
  spec.image = definition.GetImage();
  spec.exposed_ports = container_ports;
  spec.port_bindings = leases.bindings();
  spec.command = definition.RenderStartCommand(identity, dependencies);

  LOG_ORCH_INFO("Starting service {} ({}) from image {} with {} dependencies",
                id, identity.hostname, spec.image, dependencies.size());

  std::string container_id = runtime_.CreateAndStart(spec);

  std::string ip_address;
  try {
    ip_address = runtime_.Inspect(container_id);
  } catch (const ContainerInspectFailed &) {
    if (!DiscardContainer(container_id)) {
      leftover_container = container_id;
    }
    throw;
  }
  if (ip_address.empty()) {
    // Not attached to a network with an address; peers reach it by hostname
    ip_address = identity.hostname;
  }

  RunningService service;
  service.id = id;
  service.hostname = identity.hostname;
  service.container_id = container_id;
  service.endpoint = ServiceSocket{ip_address, definition.GetPrimaryPort()};
  service.port_bindings = leases.Commit();

  LOG_ORCH_DEBUG("Service {} running in container {} at {}", id, container_id,
                 service.endpoint.ToString());
  return service;
}

bool NetworkOrchestrator::DiscardContainer(const std::string &container_id) {
  try {
    runtime_.Stop(container_id);
  } catch (const ContainerTeardownFailed &e) {
    // Remove forces a running container out as well
    LOG_ORCH_WARN("Could not stop unconfirmed container {}: {}", container_id,
                  e.what());
  }
  try {
    runtime_.Remove(container_id);
  } catch (const ContainerTeardownFailed &e) {
    LOG_ORCH_ERROR("Unconfirmed container {} was left behind: {}", container_id,
                   e.what());
    return false;
  }
  return true;
}

void NetworkOrchestrator::Teardown(RunningNetwork &network) {
  LOG_ORCH_INFO("Tearing down {} services", network.Size());

  std::vector<ServiceId> order = network.StartOrder();
  std::vector<ServiceId> failed;
  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    auto service = network.Get(*it);
    if (!service) {
      continue;
    }
    try {
      runtime_.Stop(service->container_id);
      runtime_.Remove(service->container_id);
    } catch (const ContainerTeardownFailed &e) {
      LOG_ORCH_ERROR("Teardown of service {} (container {}) failed: {}",
                     service->id, service->container_id, e.what());
      failed.push_back(service->id);
      continue;
    }
    for (const auto &[internal_port, host_port] : service->port_bindings) {
      ports_.Release(host_port);
    }
    network.Erase(service->id);
  }

  if (!failed.empty()) {
    std::string ids;
    for (ServiceId id : failed) {
      ids += (ids.empty() ? "" : ", ") + std::to_string(id);
    }
    throw ContainerTeardownFailed("Failed to tear down services: " + ids);
  }
}

} // namespace orchestrator
} // namespace svcnet
