// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "errors.hpp"
#include "orchestrator/liveness_checker.hpp"
#include "orchestrator/network_config.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace svcnet {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_APP_INFO("Initializing svcnet...");

  if (!init_graph()) {
    LOG_APP_ERROR("Failed to build service graph");
    return false;
  }

  if (!init_runtime()) {
    LOG_APP_ERROR("Failed to initialize container runtime");
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::init_graph() {
  if (config_.config_path.empty()) {
    LOG_APP_ERROR("No network config given (use --config=<file>)");
    return false;
  }

  try {
    orchestrator::NetworkConfig network_config =
        orchestrator::LoadNetworkConfig(config_.config_path);
    orchestrator::ServiceGraphBuilder builder;
    service_ids_ = orchestrator::RegisterServices(network_config, builder);
    graph_ = builder.Build();
  } catch (const OrchestrationError &e) {
    LOG_APP_ERROR("{}", e.what());
    return false;
  }

  LOG_APP_INFO("Service graph: {} services, {} terminal", graph_->Size(),
               graph_->TerminalServiceIds().size());
  return true;
}

bool Application::init_runtime() {
  try {
    ports_ = std::make_unique<network::PortAllocator>(config_.port_range_start,
                                                      config_.port_range_end);
  } catch (const std::invalid_argument &e) {
    LOG_APP_ERROR("Invalid host port range: {}", e.what());
    return false;
  }

  if (ports_->Capacity() < graph_->Size()) {
    LOG_APP_WARN("Host port range holds {} ports for {} services; startup will "
                 "likely run out of ports", ports_->Capacity(), graph_->Size());
  }

  LOG_APP_INFO("Using Docker at {} (API v{})", config_.docker.socket_path,
               config_.docker.api_version);
  runtime_ = std::make_unique<runtime::DockerRuntime>(config_.docker);
  orchestrator_ = std::make_unique<orchestrator::NetworkOrchestrator>(
      *runtime_, *ports_, config_.orchestrator);
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  std::cout << GetStartupBanner(graph_->Size()) << std::flush;

  setup_signal_handlers();

  try {
    network_ = orchestrator_->CreateAndRun(*graph_);
  } catch (orchestrator::ServiceStartFailed &e) {
    LOG_APP_ERROR("{}", e.what());
    if (!e.unconfirmed_container_id().empty()) {
      LOG_APP_ERROR("Container {} could not be removed; remove it manually",
                    e.unconfirmed_container_id());
    }
    LOG_APP_ERROR("Removing {} services that had already started",
                  e.partial_network().Size());
    network_ = e.partial_network();
    teardown_network();
    return false;
  }

  running_ = true;
  print_descriptor();

  if (config_.wait_for_ready && !wait_until_ready()) {
    return false;
  }

  LOG_APP_INFO("Network is up; press Ctrl+C to stop");
  return true;
}

bool Application::wait_until_ready() {
  orchestrator::LivenessChecker::Config checker_config;
  if (config_.docker.host_ip != "0.0.0.0") {
    checker_config.host = config_.docker.host_ip;
  }
  orchestrator::LivenessChecker checker(checker_config);

  LOG_APP_INFO("Waiting up to {}s for terminal services to become live",
               config_.ready_timeout.count());
  // Ctrl+C during the wait cancels it; start() then fails and the caller
  // tears the network down
  bool ready = checker.WaitUntilReady(
      *graph_, *network_, config_.ready_timeout, std::chrono::milliseconds(500),
      [this] { return shutdown_requested_.load(); });
  if (!ready) {
    if (shutdown_requested_) {
      LOG_APP_INFO("Shutdown requested while waiting for readiness");
    } else {
      LOG_APP_ERROR("Network did not become ready within {}s", config_.ready_timeout.count());
    }
    return false;
  }
  return true;
}

void Application::print_descriptor() const {
  nlohmann::json descriptor = network_->ToJson();
  descriptor["names"] = service_ids_;
  std::cout << descriptor.dump(2) << std::endl;
}

void Application::teardown_network() {
  if (!network_ || network_->Empty()) {
    return;
  }
  if (config_.keep_containers) {
    LOG_APP_INFO("Leaving {} containers running (--keep)", network_->Size());
    return;
  }
  try {
    orchestrator_->Teardown(*network_);
  } catch (const ContainerTeardownFailed &e) {
    LOG_APP_ERROR("{}; {} containers may need manual cleanup", e.what(),
                  network_->Size());
  }
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_APP_INFO("Shutting down svcnet...");
  running_ = false;

  teardown_network();

  LOG_APP_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);
    (void)written;
    instance_->request_shutdown();
  }
}

} // namespace app
} // namespace svcnet
