// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ServiceGraph / ServiceGraphBuilder - the dependency DAG of a test network

 A dependency may only name a service that is already registered, so a
 dependency can never point at a later service. That rule makes cycles
 unrepresentable and makes registration order a valid start order, so no
 separate topological sort or cycle check is needed.

 The builder also tracks the terminal set: services no other service depends
 on. They are the last to start, and once they are all live the whole
 network is ready.

 Build() deep-copies the builder's state into an immutable ServiceGraph, so
 snapshots never alias each other or the builder.
*/

#include "orchestrator/service_definition.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <vector>

namespace svcnet {
namespace orchestrator {

using ServiceDefinitionPtr = std::shared_ptr<const ServiceDefinition>;

class ServiceGraph {
public:
  // @throws std::out_of_range if the id is not part of the graph
  const ServiceDefinition &GetDefinition(ServiceId id) const;
  const DependencySet &GetDependencies(ServiceId id) const;

  bool Contains(ServiceId id) const { return definitions_.count(id) > 0; }
  size_t Size() const { return definitions_.size(); }
  bool Empty() const { return definitions_.empty(); }

  // Topological order: every service appears after all of its dependencies
  const std::vector<ServiceId> &StartOrder() const { return start_order_; }

  // Services that no other service depends on
  const std::set<ServiceId> &TerminalServiceIds() const { return terminal_; }

private:
  friend class ServiceGraphBuilder;

  ServiceGraph(std::map<ServiceId, ServiceDefinitionPtr> definitions,
               std::map<ServiceId, DependencySet> dependencies,
               std::vector<ServiceId> start_order,
               std::set<ServiceId> terminal);

  std::map<ServiceId, ServiceDefinitionPtr> definitions_;
  std::map<ServiceId, DependencySet> dependencies_;
  std::vector<ServiceId> start_order_;
  std::set<ServiceId> terminal_;
};

// Not safe for concurrent mutation; one owner builds the graph.
class ServiceGraphBuilder {
public:
  ServiceGraphBuilder() = default;

  /**
   * Register a service
   * @param definition What to run (must not be null)
   * @param dependencies Ids returned by earlier AddService calls; pass an
   *        empty set for a service without dependencies
   * @return The new service's id
   * @throws InvalidDependency if the definition is null or a dependency id
   *         is not registered; nothing is mutated and no id is consumed
   */
  ServiceId AddService(ServiceDefinitionPtr definition,
                       const DependencySet &dependencies);

  // Independent snapshot of everything registered so far
  ServiceGraph Build() const;

  size_t Size() const { return definitions_.size(); }

private:
  std::map<ServiceId, ServiceDefinitionPtr> definitions_;
  std::map<ServiceId, DependencySet> dependencies_;
  std::vector<ServiceId> start_order_;
  std::set<ServiceId> terminal_;
  ServiceId next_id_{0};
};

} // namespace orchestrator
} // namespace svcnet
