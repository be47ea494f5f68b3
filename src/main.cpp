// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " --config=<file> [options]\n"
      << "\n"
      << "Starts the services described in <file> as Docker containers, in\n"
      << "dependency order, and keeps them running until Ctrl+C.\n"
      << "\n"
      << "Options:\n"
      << "  --config=<file>      Network description (JSON)\n"
      << "  --portrange=<a>-<b>  Host ports to publish container ports on (default: 9650-9750)\n"
      << "  --dockersock=<path>  Docker Engine socket (default: /var/run/docker.sock)\n"
      << "  --dockerapi=<ver>    Docker Engine API version (default: 1.41)\n"
      << "  --network=<name>     Docker network to attach containers to\n"
      << "  --hostip=<ip>        Host interface to publish ports on (default: 0.0.0.0)\n"
      << "  --hostnameprefix=<p> Container hostname prefix (default: service-)\n"
      << "  --readytimeout=<s>   Seconds to wait for terminal services to become live (default: 60)\n"
      << "  --nowait             Do not wait for liveness after starting\n"
      << "  --keep               Leave containers running on exit\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: graph, orchestrator, docker, app, all\n"
      << "                       Can be comma-separated: --debug=orchestrator,docker\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    svcnet::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << svcnet::GetFullVersionString() << std::endl;
        std::cout << svcnet::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--config=") == 0) {
        config.config_path = arg.substr(9);
      } else if (arg.find("--portrange=") == 0) {
        auto range = svcnet::util::SafeParsePortRange(arg.substr(12));
        if (!range) {
          std::cerr << "Error: Invalid port range: " << arg.substr(12) << std::endl;
          std::cerr << "Expected <start>-<end> with 1 <= start <= end <= 65535" << std::endl;
          return 1;
        }
        config.port_range_start = range->first;
        config.port_range_end = range->second;
      } else if (arg.find("--dockersock=") == 0) {
        config.docker.socket_path = arg.substr(13);
      } else if (arg.find("--dockerapi=") == 0) {
        config.docker.api_version = arg.substr(12);
      } else if (arg.find("--network=") == 0) {
        config.docker.network_mode = arg.substr(10);
      } else if (arg.find("--hostip=") == 0) {
        config.docker.host_ip = arg.substr(9);
      } else if (arg.find("--hostnameprefix=") == 0) {
        config.orchestrator.hostname_prefix = arg.substr(17);
      } else if (arg.find("--readytimeout=") == 0) {
        auto timeout = svcnet::util::SafeParseInt(arg.substr(15), 1, 86400);
        if (!timeout) {
          std::cerr << "Error: Invalid ready timeout: " << arg.substr(15) << std::endl;
          std::cerr << "Timeout must be a number of seconds between 1 and 86400" << std::endl;
          return 1;
        }
        config.ready_timeout = std::chrono::seconds(*timeout);
      } else if (arg == "--nowait") {
        config.wait_for_ready = false;
      } else if (arg == "--keep") {
        config.keep_containers = true;
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        for (const auto &component : svcnet::util::SplitString(arg.substr(8), ',')) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    svcnet::util::LogManager::Initialize(log_level, false);

    for (const auto &component : debug_components) {
      if (component == "all") {
        svcnet::util::LogManager::SetLogLevel("trace");
      } else {
        svcnet::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = 0;
    // Nested scope: the application (and its teardown) must finish before
    // LogManager::Shutdown()
    {
      svcnet::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        exit_code = 1;
      } else if (!app.start()) {
        LOG_ERROR("Failed to start test network");
        app.stop();
        exit_code = 1;
      } else {
        app.wait_for_shutdown();
      }
    }

    svcnet::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
