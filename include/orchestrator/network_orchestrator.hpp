// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 NetworkOrchestrator - turns a ServiceGraph into running containers

 Services are started one at a time in the graph's start order. Before a
 service starts, the endpoints and liveness probes of its dependencies are
 resolved from services started earlier in the same run and handed to the
 service's RenderStartCommand, so the container can wait on them itself.

 Startup sequence per service:
 1. Resolve dependency endpoints/probes (always present: topological order)
 2. Lease one host port per container-internal port
 3. Render the start command
 4. Create + start the container, then inspect it for its address
 5. Record a RunningService, visible to later services

 Failure policy:
 - Any failure aborts the run with ServiceStartFailed naming the service
 - Ports leased for the failing service are released; a container created
   for it but never confirmed is removed on a best-effort basis, and its id
   is carried in the exception if removal failed
 - Services started earlier are NOT torn down; they are carried in the
   exception's partial network so the caller can inspect them, resume, or
   call Teardown()
 - Nothing is retried

 Readiness (application-level liveness) is not checked here; see
 LivenessChecker.
*/

#include "errors.hpp"
#include "network/port_allocator.hpp"
#include "orchestrator/running_network.hpp"
#include "orchestrator/service_graph.hpp"
#include "runtime/container_runtime.hpp"
#include <exception>
#include <string>

namespace svcnet {
namespace orchestrator {

// Top-level CreateAndRun failure
class ServiceStartFailed : public OrchestrationError {
public:
  ServiceStartFailed(ServiceId failed_service_id, const std::string &cause,
                     RunningNetwork partial_network,
                     std::exception_ptr cause_exception = nullptr,
                     std::string unconfirmed_container_id = "");

  ServiceId failed_service_id() const { return failed_service_id_; }
  const std::string &cause() const { return cause_; }

  // Services that were running when the failure happened
  const RunningNetwork &partial_network() const { return partial_network_; }
  RunningNetwork &partial_network() { return partial_network_; }

  // Original exception (e.g. ContainerLaunchFailed) for rethrow/inspection
  std::exception_ptr cause_exception() const { return cause_exception_; }

  // Container created for the failed service that could not be removed
  // again; empty if none was left behind
  const std::string &unconfirmed_container_id() const {
    return unconfirmed_container_id_;
  }

private:
  ServiceId failed_service_id_;
  std::string cause_;
  RunningNetwork partial_network_;
  std::exception_ptr cause_exception_;
  std::string unconfirmed_container_id_;
};

class NetworkOrchestrator {
public:
  struct Config {
    Config() {}

    // Container hostname is <prefix><service id>
    std::string hostname_prefix{"service-"};
  };

  NetworkOrchestrator(runtime::ContainerRuntime &runtime,
                      network::PortAllocator &ports,
                      const Config &config = Config{});

  // Non-copyable
  NetworkOrchestrator(const NetworkOrchestrator &) = delete;
  NetworkOrchestrator &operator=(const NetworkOrchestrator &) = delete;

  /**
   * Start every service of the graph in start order
   * @throws ServiceStartFailed on the first failure (see failure policy)
   */
  RunningNetwork CreateAndRun(const ServiceGraph &graph);

  /**
   * Stop and remove every container of the network (reverse start order)
   * and release its host ports. Services torn down successfully are removed
   * from `network`; the rest stay so teardown can be retried.
   * @throws ContainerTeardownFailed after attempting every service, if any
   *         stop/remove failed
   */
  void Teardown(RunningNetwork &network);

  std::string HostnameFor(ServiceId id) const;

private:
  RunningService StartService(const ServiceGraph &graph, ServiceId id,
                              const RunningNetwork &running,
                              const std::map<ServiceId, LivenessProbe> &probes,
                              std::string &leftover_container);

  // Best-effort stop and removal of a container that never became a
  // RunningService. Returns false if the container may still exist.
  bool DiscardContainer(const std::string &container_id);

  runtime::ContainerRuntime &runtime_;
  network::PortAllocator &ports_;
  Config config_;
};

} // namespace orchestrator
} // namespace svcnet
