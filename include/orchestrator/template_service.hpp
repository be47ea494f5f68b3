// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "orchestrator/service_definition.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace svcnet {
namespace orchestrator {

/**
 * ServiceDefinition driven by a command template
 *
 * Placeholders substituted in every command token:
 *   {hostname}              container hostname
 *   {service_id}            numeric service id
 *   {rpc_port}              container-internal primary port
 *   {dependency_endpoints}  comma-separated ip:port of every dependency
 *   {dependency_ips}        comma-separated ip of every dependency
 *   {dependency_count}      number of dependencies
 *
 * A token that is exactly "{each_dependency:<format>}" is replaced by one
 * token per dependency, with {ip} and {port} substituted in <format>.
 * Unknown placeholders are left untouched.
 */
class TemplateService : public ServiceDefinition {
public:
  TemplateService(std::string image, uint16_t rpc_port,
                  std::vector<uint16_t> additional_ports, LivenessProbe liveness,
                  std::vector<std::string> command_template);

  std::string GetImage() const override { return image_; }
  uint16_t GetPrimaryPort() const override { return rpc_port_; }
  std::vector<uint16_t> GetAdditionalPorts() const override { return additional_ports_; }
  LivenessProbe GetLivenessProbe() const override { return liveness_; }

  std::vector<std::string>
  RenderStartCommand(const ServiceIdentity &identity,
                     const DependencyProbes &dependencies) const override;

  // Replace every {name} in `text` whose name is a key of `values`
  static std::string Substitute(const std::string &text,
                                const std::map<std::string, std::string> &values);

private:
  std::string image_;
  uint16_t rpc_port_;
  std::vector<uint16_t> additional_ports_;
  LivenessProbe liveness_;
  std::vector<std::string> command_template_;
};

} // namespace orchestrator
} // namespace svcnet
