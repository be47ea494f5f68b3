// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/http_client.hpp"
#include "orchestrator/running_network.hpp"
#include "orchestrator/service_graph.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <set>
#include <string>

namespace svcnet {
namespace orchestrator {

/**
 * Polls services' liveness probes from the host side
 *
 * A probe is sent as a JSON-RPC 2.0 POST to the host port published for the
 * service's primary port. It passes when the service answers HTTP 2xx with a
 * JSON object carrying "result" and no "error".
 *
 * The network is ready once every terminal service passes: terminal services
 * start last and their own start commands wait on their dependencies.
 */
class LivenessChecker {
public:
  struct Config {
    Config() {}

    // Host the published ports are reachable on
    std::string host{"127.0.0.1"};
    std::chrono::milliseconds request_timeout{2000};
  };

  explicit LivenessChecker(const Config &config = Config{});

  // One probe attempt; never throws for transport errors
  bool IsLive(const RunningService &service, const LivenessProbe &probe) const;

  // Ids from `network.TerminalServiceIds()` that do not pass yet
  std::set<ServiceId> PendingServices(const ServiceGraph &graph,
                                      const RunningNetwork &network) const;

  /**
   * Poll until every terminal service is live, the timeout expires, or
   * `stop_requested` returns true (checked between probe rounds and while
   * sleeping)
   * @return true if the network became ready
   */
  bool WaitUntilReady(const ServiceGraph &graph, const RunningNetwork &network,
                      std::chrono::milliseconds timeout,
                      std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500),
                      const std::function<bool()> &stop_requested = nullptr) const;

  static std::string BuildRequestBody(const LivenessProbe &probe);
  static bool IsLiveResponse(const network::HttpResponse &response);

private:
  Config config_;
};

} // namespace orchestrator
} // namespace svcnet
