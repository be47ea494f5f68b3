// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/http_client.hpp"
#include "runtime/container_runtime.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace svcnet {
namespace runtime {

/**
 * ContainerRuntime backed by the Docker Engine REST API
 *
 * Talks to the daemon over its Unix domain socket. Images must already be
 * present locally; nothing is pulled or built.
 */
class DockerRuntime : public ContainerRuntime {
public:
  struct Config {
    Config() {}

    std::string socket_path{"/var/run/docker.sock"};
    std::string api_version{"1.41"};
    // Host interface published ports are bound to
    std::string host_ip{"0.0.0.0"};
    // Docker network to attach containers to (empty = daemon default)
    std::string network_mode;
    int stop_timeout_seconds{10};
    std::chrono::milliseconds request_timeout{network::DEFAULT_HTTP_TIMEOUT};
  };

  explicit DockerRuntime(const Config &config = Config{});

  std::string CreateAndStart(const ContainerSpec &spec) override;
  std::string Inspect(const std::string &container_id) override;
  void Stop(const std::string &container_id) override;
  void Remove(const std::string &container_id) override;

  // Body of POST /containers/create for a spec
  nlohmann::json BuildCreateBody(const ContainerSpec &spec) const;

  // Address from a GET /containers/{id}/json document; empty if none
  static std::string ExtractIpAddress(const nlohmann::json &inspect);

private:
  network::HttpResponse Call(const std::string &method, const std::string &path,
                             const std::string &body = "");

  // Docker's {"message": "..."} error text, or the raw body
  static std::string ErrorMessage(const network::HttpResponse &response);

  Config config_;
};

} // namespace runtime
} // namespace svcnet
