// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "orchestrator/network_config.hpp"
#include "errors.hpp"
#include "orchestrator/template_service.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <memory>
#include <set>

using json = nlohmann::json;

namespace svcnet {
namespace orchestrator {

namespace {

const json &RequireField(const json &object, const std::string &field,
                         const std::string &context) {
  if (!object.contains(field)) {
    throw ConfigError(context + ": missing field '" + field + "'");
  }
  return object.at(field);
}

std::string RequireString(const json &object, const std::string &field,
                          const std::string &context) {
  const json &value = RequireField(object, field, context);
  if (!value.is_string() || value.get<std::string>().empty()) {
    throw ConfigError(context + "." + field + ": expected a non-empty string");
  }
  return value.get<std::string>();
}

uint16_t ToPort(const json &value, const std::string &context) {
  if (!value.is_number_integer()) {
    throw ConfigError(context + ": expected a port number");
  }
  int64_t port = value.get<int64_t>();
  if (port < 1 || port > 65535) {
    throw ConfigError(context + ": port " + std::to_string(port) + " out of range");
  }
  return static_cast<uint16_t>(port);
}

std::vector<std::string> ToStringList(const json &value, const std::string &context) {
  if (!value.is_array()) {
    throw ConfigError(context + ": expected an array of strings");
  }
  std::vector<std::string> items;
  for (const auto &item : value) {
    if (!item.is_string()) {
      throw ConfigError(context + ": expected an array of strings");
    }
    items.push_back(item.get<std::string>());
  }
  return items;
}

LivenessProbe ParseLiveness(const json &value, const std::string &context) {
  if (!value.is_object()) {
    throw ConfigError(context + ": expected an object");
  }
  LivenessProbe probe;
  probe.method = RequireString(value, "method", context);
  if (value.contains("params")) {
    probe.params = value.at("params");
  }
  if (value.contains("path")) {
    if (!value.at("path").is_string()) {
      throw ConfigError(context + ".path: expected a string");
    }
    probe.path = value.at("path").get<std::string>();
  }
  return probe;
}

ServiceConfig ParseService(const json &value, const std::string &context) {
  if (!value.is_object()) {
    throw ConfigError(context + ": expected an object");
  }

  ServiceConfig service;
  service.name = RequireString(value, "name", context);
  service.image = RequireString(value, "image", context);
  service.rpc_port = ToPort(RequireField(value, "rpc_port", context), context + ".rpc_port");
  service.liveness = ParseLiveness(RequireField(value, "liveness", context), context + ".liveness");
  service.command = ToStringList(RequireField(value, "command", context), context + ".command");

  if (value.contains("additional_ports")) {
    const json &ports = value.at("additional_ports");
    if (!ports.is_array()) {
      throw ConfigError(context + ".additional_ports: expected an array");
    }
    for (const auto &port : ports) {
      service.additional_ports.push_back(ToPort(port, context + ".additional_ports"));
    }
  }
  if (value.contains("depends_on")) {
    service.depends_on = ToStringList(value.at("depends_on"), context + ".depends_on");
  }
  return service;
}

} // namespace

NetworkConfig ParseNetworkConfig(const json &document) {
  if (!document.is_object()) {
    throw ConfigError("network config: expected a JSON object");
  }
  const json &services = RequireField(document, "services", "network config");
  if (!services.is_array() || services.empty()) {
    throw ConfigError("network config: 'services' must be a non-empty array");
  }

  NetworkConfig config;
  std::set<std::string> seen;
  for (size_t i = 0; i < services.size(); ++i) {
    const std::string context = "services[" + std::to_string(i) + "]";
    ServiceConfig service = ParseService(services[i], context);

    for (const auto &dependency : service.depends_on) {
      if (seen.count(dependency) == 0) {
        throw ConfigError(context + ": '" + service.name + "' depends on '" + dependency +
                          "', which is not declared before it");
      }
    }
    if (!seen.insert(service.name).second) {
      throw ConfigError(context + ": duplicate service name '" + service.name + "'");
    }
    config.services.push_back(std::move(service));
  }
  return config;
}

NetworkConfig LoadNetworkConfig(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Cannot open network config " + path.string());
  }

  json document = json::parse(file, nullptr, false);
  if (document.is_discarded()) {
    throw ConfigError("Network config " + path.string() + " is not valid JSON");
  }

  NetworkConfig config = ParseNetworkConfig(document);
  LOG_INFO("Loaded {} service definitions from {}", config.services.size(), path.string());
  return config;
}

std::map<std::string, ServiceId> RegisterServices(const NetworkConfig &config,
                                                  ServiceGraphBuilder &builder) {
  std::map<std::string, ServiceId> ids;
  for (const auto &service : config.services) {
    DependencySet dependencies;
    for (const auto &dependency : service.depends_on) {
      auto it = ids.find(dependency);
      if (it == ids.end()) {
        throw ConfigError("Service '" + service.name + "' depends on unknown service '" +
                          dependency + "'");
      }
      dependencies.insert(it->second);
    }

    auto definition = std::make_shared<TemplateService>(
        service.image, service.rpc_port, service.additional_ports, service.liveness,
        service.command);
    ServiceId id = builder.AddService(definition, dependencies);
    ids[service.name] = id;
    LOG_GRAPH_DEBUG("Service '{}' registered as {}", service.name, id);
  }
  return ids;
}

} // namespace orchestrator
} // namespace svcnet
