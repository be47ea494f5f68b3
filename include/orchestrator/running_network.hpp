// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "orchestrator/service_definition.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace svcnet {
namespace orchestrator {

// A service whose container the runtime confirmed as started
struct RunningService {
  ServiceId id{0};
  std::string hostname;
  std::string container_id;
  ServiceSocket endpoint;                       // container address + primary port
  std::map<uint16_t, uint16_t> port_bindings;   // internal port -> leased host port

  // Host port bound to a container-internal port, if any
  std::optional<uint16_t> GetHostPort(uint16_t internal_port) const {
    auto it = port_bindings.find(internal_port);
    if (it == port_bindings.end()) {
      return std::nullopt;
    }
    return it->second;
  }
};

// Queryable descriptor of the containers started for one ServiceGraph.
// After a successful CreateAndRun it covers every service of the graph; the
// copy attached to ServiceStartFailed covers only the services that started.
class RunningNetwork {
public:
  RunningNetwork() = default;
  explicit RunningNetwork(std::set<ServiceId> terminal_ids)
      : terminal_ids_(std::move(terminal_ids)) {}

  std::optional<RunningService> Get(ServiceId id) const;
  bool Contains(ServiceId id) const { return services_.count(id) > 0; }
  size_t Size() const { return services_.size(); }
  bool Empty() const { return services_.empty(); }

  // Terminal services of the source graph; readiness is defined over them
  const std::set<ServiceId> &TerminalServiceIds() const { return terminal_ids_; }

  // Ids in the order their containers were started
  const std::vector<ServiceId> &StartOrder() const { return start_order_; }

  // Descriptor for printing / handing to test drivers
  nlohmann::json ToJson() const;

private:
  friend class NetworkOrchestrator;

  void Add(RunningService service);
  void Erase(ServiceId id);

  std::map<ServiceId, RunningService> services_;
  std::vector<ServiceId> start_order_;
  std::set<ServiceId> terminal_ids_;
};

} // namespace orchestrator
} // namespace svcnet
