// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "orchestrator/service_graph.hpp"
#include "errors.hpp"
#include "util/logging.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace svcnet {
namespace orchestrator {

ServiceGraph::ServiceGraph(std::map<ServiceId, ServiceDefinitionPtr> definitions,
                           std::map<ServiceId, DependencySet> dependencies,
                           std::vector<ServiceId> start_order,
                           std::set<ServiceId> terminal)
    : definitions_(std::move(definitions)),
      dependencies_(std::move(dependencies)),
      start_order_(std::move(start_order)), terminal_(std::move(terminal)) {}

const ServiceDefinition &ServiceGraph::GetDefinition(ServiceId id) const {
  auto it = definitions_.find(id);
  if (it == definitions_.end()) {
    throw std::out_of_range("Service " + std::to_string(id) + " is not part of the graph");
  }
  return *it->second;
}

const DependencySet &ServiceGraph::GetDependencies(ServiceId id) const {
  auto it = dependencies_.find(id);
  if (it == dependencies_.end()) {
    throw std::out_of_range("Service " + std::to_string(id) + " is not part of the graph");
  }
  return it->second;
}

ServiceId ServiceGraphBuilder::AddService(ServiceDefinitionPtr definition,
                                          const DependencySet &dependencies) {
  if (!definition) {
    throw InvalidDependency("Service definition must not be null");
  }

  // Validate everything before touching any state
  for (ServiceId dependency_id : dependencies) {
    if (definitions_.count(dependency_id) == 0) {
      throw InvalidDependency("Declared a dependency on service " +
                              std::to_string(dependency_id) +
                              " but no service with this id has been registered");
    }
  }

  ServiceId id = next_id_++;
  definitions_[id] = std::move(definition);
  dependencies_[id] = dependencies;

  terminal_.insert(id);
  for (ServiceId dependency_id : dependencies) {
    terminal_.erase(dependency_id);
  }

  // Dependencies are always registered first, so registration order is
  // already a topological order.
  start_order_.push_back(id);

  LOG_GRAPH_DEBUG("Registered service {} with {} dependencies", id, dependencies.size());
  return id;
}

ServiceGraph ServiceGraphBuilder::Build() const {
  LOG_GRAPH_TRACE("Building graph snapshot with {} services ({} terminal)",
                  definitions_.size(), terminal_.size());
  return ServiceGraph(definitions_, dependencies_, start_order_, terminal_);
}

} // namespace orchestrator
} // namespace svcnet
