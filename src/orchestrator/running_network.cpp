// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "orchestrator/running_network.hpp"
#include <algorithm>
#include <utility>

using json = nlohmann::json;

namespace svcnet {
namespace orchestrator {

std::optional<RunningService> RunningNetwork::Get(ServiceId id) const {
  auto it = services_.find(id);
  if (it == services_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void RunningNetwork::Add(RunningService service) {
  ServiceId id = service.id;
  services_[id] = std::move(service);
  start_order_.push_back(id);
}

void RunningNetwork::Erase(ServiceId id) {
  services_.erase(id);
  start_order_.erase(std::remove(start_order_.begin(), start_order_.end(), id),
                     start_order_.end());
}

json RunningNetwork::ToJson() const {
  json services = json::object();
  for (const auto &[id, service] : services_) {
    json ports = json::object();
    for (const auto &[internal_port, host_port] : service.port_bindings) {
      ports[std::to_string(internal_port)] = host_port;
    }
    services[std::to_string(id)] = {{"hostname", service.hostname},
                                    {"container_id", service.container_id},
                                    {"ip_address", service.endpoint.ip_address},
                                    {"rpc_port", service.endpoint.port},
                                    {"port_bindings", ports}};
  }

  return json{{"services", services},
              {"start_order", start_order_},
              {"terminal_services", terminal_ids_}};
}

} // namespace orchestrator
} // namespace svcnet
