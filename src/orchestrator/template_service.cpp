// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "orchestrator/template_service.hpp"
#include <utility>

namespace svcnet {
namespace orchestrator {

namespace {

constexpr const char *EACH_DEPENDENCY_PREFIX = "{each_dependency:";

std::string JoinDependencies(const DependencyProbes &dependencies, bool with_port) {
  std::string joined;
  for (const auto &[socket, probe] : dependencies) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += with_port ? socket.ToString() : socket.ip_address;
  }
  return joined;
}

} // namespace

TemplateService::TemplateService(std::string image, uint16_t rpc_port,
                                 std::vector<uint16_t> additional_ports,
                                 LivenessProbe liveness,
                                 std::vector<std::string> command_template)
    : image_(std::move(image)), rpc_port_(rpc_port),
      additional_ports_(std::move(additional_ports)),
      liveness_(std::move(liveness)),
      command_template_(std::move(command_template)) {}

std::string TemplateService::Substitute(const std::string &text,
                                        const std::map<std::string, std::string> &values) {
  std::string out;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t open = text.find('{', pos);
    if (open == std::string::npos) {
      break;
    }
    size_t close = text.find('}', open + 1);
    if (close == std::string::npos) {
      break;
    }
    out.append(text, pos, open - pos);
    auto it = values.find(text.substr(open + 1, close - open - 1));
    if (it != values.end()) {
      out += it->second;
    } else {
      out.append(text, open, close - open + 1);
    }
    pos = close + 1;
  }
  if (pos < text.size()) {
    out.append(text, pos, std::string::npos);
  }
  return out;
}

std::vector<std::string>
TemplateService::RenderStartCommand(const ServiceIdentity &identity,
                                    const DependencyProbes &dependencies) const {
  const std::map<std::string, std::string> values = {
      {"hostname", identity.hostname},
      {"service_id", std::to_string(identity.id)},
      {"rpc_port", std::to_string(rpc_port_)},
      {"dependency_endpoints", JoinDependencies(dependencies, true)},
      {"dependency_ips", JoinDependencies(dependencies, false)},
      {"dependency_count", std::to_string(dependencies.size())},
  };

  const std::string prefix = EACH_DEPENDENCY_PREFIX;
  std::vector<std::string> command;
  for (const auto &token : command_template_) {
    if (token.size() > prefix.size() && token.compare(0, prefix.size(), prefix) == 0 &&
        token.back() == '}') {
      const std::string format = token.substr(prefix.size(), token.size() - prefix.size() - 1);
      for (const auto &[socket, probe] : dependencies) {
        command.push_back(Substitute(format, {{"ip", socket.ip_address},
                                              {"port", std::to_string(socket.port)}}));
      }
      continue;
    }
    command.push_back(Substitute(token, values));
  }
  return command;
}

} // namespace orchestrator
} // namespace svcnet
