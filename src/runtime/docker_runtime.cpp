// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "runtime/docker_runtime.hpp"
#include "errors.hpp"
#include "util/logging.hpp"
#include "version.hpp"

using json = nlohmann::json;

namespace svcnet {
namespace runtime {

namespace {

// Docker's "<port>/tcp" port key
std::string PortKey(uint16_t port) { return std::to_string(port) + "/tcp"; }

std::string ShortId(const std::string &container_id) {
  return container_id.substr(0, 12);
}

} // namespace

DockerRuntime::DockerRuntime(const Config &config) : config_(config) {}

network::HttpResponse DockerRuntime::Call(const std::string &method,
                                          const std::string &path,
                                          const std::string &body) {
  network::HttpRequest request;
  request.method = method;
  request.target = config_.api_version.empty() ? path : "/v" + config_.api_version + path;
  request.body = body;

  LOG_DOCKER_TRACE("{} {}", request.method, request.target);
  auto response = network::SendOverUnixSocket(config_.socket_path, request,
                                              config_.request_timeout);
  LOG_DOCKER_TRACE("{} {} -> {}", request.method, request.target, response.status);
  return response;
}

std::string DockerRuntime::ErrorMessage(const network::HttpResponse &response) {
  json body = json::parse(response.body, nullptr, false);
  if (!body.is_discarded() && body.is_object() && body.contains("message") &&
      body["message"].is_string()) {
    return body["message"].get<std::string>();
  }
  return "HTTP " + std::to_string(response.status) +
         (response.body.empty() ? "" : ": " + response.body);
}

json DockerRuntime::BuildCreateBody(const ContainerSpec &spec) const {
  json exposed = json::object();
  for (uint16_t port : spec.exposed_ports) {
    exposed[PortKey(port)] = json::object();
  }

  json bindings = json::object();
  for (const auto &[internal_port, host_port] : spec.port_bindings) {
    bindings[PortKey(internal_port)] =
        json::array({{{"HostIp", config_.host_ip}, {"HostPort", std::to_string(host_port)}}});
  }

  json host_config = {{"PortBindings", bindings}};
  if (!config_.network_mode.empty()) {
    host_config["NetworkMode"] = config_.network_mode;
  }

  return json{{"Hostname", spec.hostname},
              {"Image", spec.image},
              {"Cmd", spec.command},
              {"Tty", false},
              {"ExposedPorts", exposed},
              {"Labels", {{"svcnet.version", GetVersionString()},
                          {"svcnet.hostname", spec.hostname}}},
              {"HostConfig", host_config}};
}

std::string DockerRuntime::CreateAndStart(const ContainerSpec &spec) {
  std::string create_body;
  try {
    create_body = BuildCreateBody(spec).dump();
  } catch (const json::exception &e) {
    // e.g. invalid UTF-8 in a command token
    throw ContainerLaunchFailed("Could not encode container spec for image " +
                                spec.image + ": " + e.what());
  }

  network::HttpResponse created;
  try {
    created = Call("POST", "/containers/create", create_body);
  } catch (const network::HttpError &e) {
    throw ContainerLaunchFailed("Could not create container from image " +
                                spec.image + ": " + e.what());
  }
  if (!created.IsSuccess()) {
    throw ContainerLaunchFailed("Could not create container from image " +
                                spec.image + ": " + ErrorMessage(created));
  }

  json created_body = json::parse(created.body, nullptr, false);
  if (created_body.is_discarded() || !created_body.contains("Id") ||
      !created_body["Id"].is_string()) {
    throw ContainerLaunchFailed("Docker returned no container id for image " + spec.image);
  }
  const std::string container_id = created_body["Id"].get<std::string>();
  if (created_body.contains("Warnings") && created_body["Warnings"].is_array()) {
    for (const auto &warning : created_body["Warnings"]) {
      LOG_DOCKER_WARN("Container {}: {}", ShortId(container_id), warning.dump());
    }
  }

  std::string start_error;
  try {
    auto started = Call("POST", "/containers/" + container_id + "/start");
    // 304: already started
    if (!started.IsSuccess() && started.status != 304) {
      start_error = ErrorMessage(started);
    }
  } catch (const network::HttpError &e) {
    start_error = e.what();
  }

  if (!start_error.empty()) {
    // Created but never ran; don't leave it behind
    try {
      Remove(container_id);
    } catch (const ContainerTeardownFailed &e) {
      LOG_DOCKER_WARN("Could not remove unstarted container {}: {}",
                      ShortId(container_id), e.what());
    }
    throw ContainerLaunchFailed("Could not start container from image " +
                                spec.image + ": " + start_error);
  }

  LOG_DOCKER_DEBUG("Started container {} ({}) from {}", ShortId(container_id),
                   spec.hostname, spec.image);
  return container_id;
}

std::string DockerRuntime::ExtractIpAddress(const json &inspect) {
  if (!inspect.contains("NetworkSettings") || !inspect["NetworkSettings"].is_object()) {
    return "";
  }
  const json &settings = inspect["NetworkSettings"];
  if (settings.contains("IPAddress") && settings["IPAddress"].is_string() &&
      !settings["IPAddress"].get<std::string>().empty()) {
    return settings["IPAddress"].get<std::string>();
  }
  // User-defined networks only report the address per network
  if (settings.contains("Networks") && settings["Networks"].is_object()) {
    for (const auto &attachment : settings["Networks"]) {
      if (attachment.is_object() && attachment.contains("IPAddress") &&
          attachment["IPAddress"].is_string() &&
          !attachment["IPAddress"].get<std::string>().empty()) {
        return attachment["IPAddress"].get<std::string>();
      }
    }
  }
  return "";
}

std::string DockerRuntime::Inspect(const std::string &container_id) {
  network::HttpResponse response;
  try {
    response = Call("GET", "/containers/" + container_id + "/json");
  } catch (const network::HttpError &e) {
    throw ContainerInspectFailed("Could not inspect container " +
                                 ShortId(container_id) + ": " + e.what());
  }
  if (!response.IsSuccess()) {
    throw ContainerInspectFailed("Could not inspect container " +
                                 ShortId(container_id) + ": " + ErrorMessage(response));
  }

  json inspect = json::parse(response.body, nullptr, false);
  if (inspect.is_discarded()) {
    throw ContainerInspectFailed("Unparsable inspect response for container " +
                                 ShortId(container_id));
  }
  return ExtractIpAddress(inspect);
}

void DockerRuntime::Stop(const std::string &container_id) {
  network::HttpResponse response;
  try {
    response = Call("POST", "/containers/" + container_id + "/stop?t=" +
                                std::to_string(config_.stop_timeout_seconds));
  } catch (const network::HttpError &e) {
    throw ContainerTeardownFailed("Could not stop container " +
                                  ShortId(container_id) + ": " + e.what());
  }
  // 304: already stopped
  if (!response.IsSuccess() && response.status != 304) {
    throw ContainerTeardownFailed("Could not stop container " +
                                  ShortId(container_id) + ": " + ErrorMessage(response));
  }
  LOG_DOCKER_DEBUG("Stopped container {}", ShortId(container_id));
}

void DockerRuntime::Remove(const std::string &container_id) {
  network::HttpResponse response;
  try {
    response = Call("DELETE", "/containers/" + container_id + "?force=true");
  } catch (const network::HttpError &e) {
    throw ContainerTeardownFailed("Could not remove container " +
                                  ShortId(container_id) + ": " + e.what());
  }
  // 404: already gone
  if (!response.IsSuccess() && response.status != 404) {
    throw ContainerTeardownFailed("Could not remove container " +
                                  ShortId(container_id) + ": " + ErrorMessage(response));
  }
  LOG_DOCKER_DEBUG("Removed container {}", ShortId(container_id));
}

} // namespace runtime
} // namespace svcnet
