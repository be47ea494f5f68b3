// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/port_allocator.hpp"
#include "orchestrator/network_orchestrator.hpp"
#include "orchestrator/running_network.hpp"
#include "orchestrator/service_graph.hpp"
#include "runtime/container_runtime.hpp"
#include "runtime/docker_runtime.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace svcnet {
namespace app {

// Application configuration
struct AppConfig {
  // Network description file
  std::filesystem::path config_path;

  // Host port range leased to published container ports
  uint16_t port_range_start = 9650;
  uint16_t port_range_end = 9750;

  // Docker Engine connection and container placement
  runtime::DockerRuntime::Config docker;

  orchestrator::NetworkOrchestrator::Config orchestrator;

  // Readiness
  bool wait_for_ready = true;
  std::chrono::seconds ready_timeout{60};

  // Leave containers running on exit
  bool keep_containers = false;

  // Logging
  bool verbose = false;
};

// Application - builds the service graph from the description file, starts
// the network, waits for readiness, and tears it down on shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Status
  bool is_running() const { return running_; }
  const std::optional<orchestrator::RunningNetwork> &running_network() const {
    return network_;
  }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order)
  std::optional<orchestrator::ServiceGraph> graph_;
  std::map<std::string, orchestrator::ServiceId> service_ids_;
  std::unique_ptr<network::PortAllocator> ports_;
  std::unique_ptr<runtime::ContainerRuntime> runtime_;
  std::unique_ptr<orchestrator::NetworkOrchestrator> orchestrator_;
  std::optional<orchestrator::RunningNetwork> network_;

  // Initialization steps
  bool init_graph();
  bool init_runtime();

  bool wait_until_ready();
  void print_descriptor() const;
  void teardown_network();

  // Shutdown
  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace svcnet
