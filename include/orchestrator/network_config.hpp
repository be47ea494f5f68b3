// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Network description file

 {
   "services": [
     {
       "name": "boot",
       "image": "example/node:latest",
       "rpc_port": 9650,
       "additional_ports": [9651],
       "liveness": {"method": "health.getLiveness", "params": {}, "path": "/ext/health"},
       "command": ["/node", "--bootstrap-ips={dependency_ips}"],
       "depends_on": []
     }
   ]
 }

 "additional_ports", "liveness.params", "liveness.path" and "depends_on" are
 optional. A service may only depend on services listed before it, the same
 rule ServiceGraphBuilder enforces.
*/

#include "orchestrator/service_definition.hpp"
#include "orchestrator/service_graph.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace svcnet {
namespace orchestrator {

struct ServiceConfig {
  std::string name;
  std::string image;
  uint16_t rpc_port{0};
  std::vector<uint16_t> additional_ports;
  LivenessProbe liveness;
  std::vector<std::string> command;
  std::vector<std::string> depends_on;
};

struct NetworkConfig {
  std::vector<ServiceConfig> services;
};

// @throws ConfigError on missing/mistyped fields, bad ports, duplicate names
// or dependencies on unknown / later services
NetworkConfig ParseNetworkConfig(const nlohmann::json &document);

// @throws ConfigError if the file cannot be read or parsed
NetworkConfig LoadNetworkConfig(const std::filesystem::path &path);

// Register every service (as a TemplateService) with the builder, in file
// order. Returns service name -> assigned id.
std::map<std::string, ServiceId> RegisterServices(const NetworkConfig &config,
                                                  ServiceGraphBuilder &builder);

} // namespace orchestrator
} // namespace svcnet
