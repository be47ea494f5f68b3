// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "orchestrator/liveness_checker.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;

namespace svcnet {
namespace orchestrator {

LivenessChecker::LivenessChecker(const Config &config) : config_(config) {}

std::string LivenessChecker::BuildRequestBody(const LivenessProbe &probe) {
  return json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", probe.method}, {"params", probe.params}}
      .dump();
}

bool LivenessChecker::IsLiveResponse(const network::HttpResponse &response) {
  if (!response.IsSuccess()) {
    return false;
  }
  json body = json::parse(response.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    return false;
  }
  if (body.contains("error") && !body["error"].is_null()) {
    return false;
  }
  return body.contains("result");
}

bool LivenessChecker::IsLive(const RunningService &service,
                             const LivenessProbe &probe) const {
  auto host_port = service.GetHostPort(service.endpoint.port);
  if (!host_port) {
    LOG_ORCH_WARN("Service {} has no published RPC port; cannot probe", service.id);
    return false;
  }

  network::HttpRequest request;
  request.method = "POST";
  request.target = probe.path.empty() ? "/" : probe.path;
  request.host = config_.host + ":" + std::to_string(*host_port);
  request.body = BuildRequestBody(probe);

  try {
    auto response = network::SendOverTcp(config_.host, *host_port, request,
                                         config_.request_timeout);
    bool live = IsLiveResponse(response);
    LOG_ORCH_TRACE("Probe {} on service {} -> HTTP {} ({})", probe.method, service.id,
                   response.status, live ? "live" : "not live");
    return live;
  } catch (const network::HttpError &e) {
    LOG_ORCH_TRACE("Probe {} on service {} failed: {}", probe.method, service.id, e.what());
    return false;
  }
}

std::set<ServiceId> LivenessChecker::PendingServices(const ServiceGraph &graph,
                                                     const RunningNetwork &network) const {
  std::set<ServiceId> pending;
  for (ServiceId id : network.TerminalServiceIds()) {
    auto service = network.Get(id);
    if (!service || !IsLive(*service, graph.GetDefinition(id).GetLivenessProbe())) {
      pending.insert(id);
    }
  }
  return pending;
}

bool LivenessChecker::WaitUntilReady(const ServiceGraph &graph,
                                     const RunningNetwork &network,
                                     std::chrono::milliseconds timeout,
                                     std::chrono::milliseconds poll_interval,
                                     const std::function<bool()> &stop_requested) const {
  // Sleep granularity while waiting, so a stop request is seen promptly
  constexpr auto STOP_CHECK_INTERVAL = std::chrono::milliseconds(100);
  auto stopping = [&stop_requested] { return stop_requested && stop_requested(); };

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto pending = PendingServices(graph, network);
    if (pending.empty()) {
      LOG_ORCH_INFO("All {} terminal services are live", network.TerminalServiceIds().size());
      return true;
    }
    if (stopping()) {
      LOG_ORCH_INFO("Readiness wait cancelled; {} terminal services still pending",
                    pending.size());
      return false;
    }
    if (std::chrono::steady_clock::now() + poll_interval > deadline) {
      LOG_ORCH_WARN("Network not ready after {} ms; {} terminal services still pending",
                    timeout.count(), pending.size());
      return false;
    }
    LOG_ORCH_DEBUG("Waiting on {} terminal services", pending.size());

    const auto next_round = std::chrono::steady_clock::now() + poll_interval;
    while (std::chrono::steady_clock::now() < next_round) {
      if (stopping()) {
        LOG_ORCH_INFO("Readiness wait cancelled; {} terminal services still pending",
                      pending.size());
        return false;
      }
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          next_round - std::chrono::steady_clock::now());
      std::this_thread::sleep_for(std::min(remaining, STOP_CHECK_INTERVAL));
    }
  }
}

} // namespace orchestrator
} // namespace svcnet
