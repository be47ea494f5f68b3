// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for network description parsing and registration

#include <catch2/catch_test_macros.hpp>
#include "errors.hpp"
#include "orchestrator/network_config.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace svcnet;
using namespace svcnet::orchestrator;
using json = nlohmann::json;

namespace {

json Service(const std::string& name, std::vector<std::string> depends_on = {}) {
    return json{{"name", name},
                {"image", "example/" + name + ":latest"},
                {"rpc_port", 9650},
                {"liveness", {{"method", "health.getLiveness"}}},
                {"command", json::array({"/node", "--name={hostname}"})},
                {"depends_on", depends_on}};
}

json Document(std::vector<json> services) {
    return json{{"services", services}};
}

bool ThrowsConfigErrorContaining(const json& document, const std::string& fragment) {
    try {
        ParseNetworkConfig(document);
    } catch (const ConfigError& e) {
        return std::string(e.what()).find(fragment) != std::string::npos;
    }
    return false;
}

} // namespace

TEST_CASE("ParseNetworkConfig - valid documents", "[config]") {
    SECTION("Minimal service uses defaults for optional fields") {
        json entry = {{"name", "boot"},
                      {"image", "example/node:latest"},
                      {"rpc_port", 9650},
                      {"liveness", {{"method", "health.getLiveness"}}},
                      {"command", json::array()}};
        json document = {{"services", json::array({entry})}};
        NetworkConfig config = ParseNetworkConfig(document);
        REQUIRE(config.services.size() == 1);

        const ServiceConfig& boot = config.services[0];
        REQUIRE(boot.name == "boot");
        REQUIRE(boot.image == "example/node:latest");
        REQUIRE(boot.rpc_port == 9650);
        REQUIRE(boot.additional_ports.empty());
        REQUIRE(boot.depends_on.empty());
        REQUIRE(boot.command.empty());
        REQUIRE(boot.liveness.method == "health.getLiveness");
        REQUIRE(boot.liveness.params == json::object());
        REQUIRE(boot.liveness.path == "/");
    }

    SECTION("All fields") {
        json boot = Service("boot");
        boot["additional_ports"] = json::array({9651, 9652});
        boot["liveness"] = {{"method", "health.health"},
                            {"params", {{"tags", json::array({"P"})}}},
                            {"path", "/ext/health"}};
        NetworkConfig config = ParseNetworkConfig(Document({boot, Service("peer", {"boot"})}));

        REQUIRE(config.services.size() == 2);
        REQUIRE(config.services[0].additional_ports == std::vector<uint16_t>{9651, 9652});
        REQUIRE(config.services[0].liveness.path == "/ext/health");
        REQUIRE(config.services[0].liveness.params["tags"][0] == "P");
        REQUIRE(config.services[0].command ==
                std::vector<std::string>{"/node", "--name={hostname}"});
        REQUIRE(config.services[1].depends_on == std::vector<std::string>{"boot"});
    }
}

TEST_CASE("ParseNetworkConfig - invalid documents", "[config]") {
    SECTION("Not an object") {
        REQUIRE_THROWS_AS(ParseNetworkConfig(json::array()), ConfigError);
    }

    SECTION("Missing or empty services") {
        REQUIRE(ThrowsConfigErrorContaining(json::object(), "missing field 'services'"));
        REQUIRE(ThrowsConfigErrorContaining(Document({}), "non-empty array"));
    }

    SECTION("Missing required field names the service") {
        json service = Service("boot");
        service.erase("image");
        REQUIRE(ThrowsConfigErrorContaining(Document({service}),
                                            "services[0]: missing field 'image'"));
    }

    SECTION("Empty name") {
        REQUIRE(ThrowsConfigErrorContaining(Document({Service("")}), "services[0].name"));
    }

    SECTION("Port out of range") {
        json service = Service("boot");
        service["rpc_port"] = 70000;
        REQUIRE(ThrowsConfigErrorContaining(Document({service}), "out of range"));

        service["rpc_port"] = 0;
        REQUIRE(ThrowsConfigErrorContaining(Document({service}), "out of range"));

        service["rpc_port"] = "9650";
        REQUIRE(ThrowsConfigErrorContaining(Document({service}), "expected a port number"));
    }

    SECTION("Bad additional port") {
        json service = Service("boot");
        service["additional_ports"] = json::array({9651, -1});
        REQUIRE(ThrowsConfigErrorContaining(Document({service}), "services[0].additional_ports"));
    }

    SECTION("Command must be an array of strings") {
        json service = Service("boot");
        service["command"] = "/node --flag";
        REQUIRE(ThrowsConfigErrorContaining(Document({service}), "services[0].command"));

        service["command"] = json::array({"/node", 5});
        REQUIRE(ThrowsConfigErrorContaining(Document({service}), "services[0].command"));
    }

    SECTION("Liveness without a method") {
        json service = Service("boot");
        service["liveness"] = {{"params", json::object()}};
        REQUIRE(ThrowsConfigErrorContaining(Document({service}), "missing field 'method'"));
    }

    SECTION("Duplicate names") {
        REQUIRE(ThrowsConfigErrorContaining(Document({Service("boot"), Service("boot")}),
                                            "duplicate service name 'boot'"));
    }

    SECTION("Dependency on a later or unknown service") {
        REQUIRE(ThrowsConfigErrorContaining(
            Document({Service("a", {"b"}), Service("b")}), "not declared before it"));
        REQUIRE(ThrowsConfigErrorContaining(
            Document({Service("a", {"ghost"})}), "not declared before it"));
    }

    SECTION("Self dependency") {
        REQUIRE(ThrowsConfigErrorContaining(Document({Service("a", {"a"})}),
                                            "not declared before it"));
    }
}

TEST_CASE("RegisterServices - builds the graph", "[config][graph]") {
    NetworkConfig config = ParseNetworkConfig(Document({
        Service("boot"),
        Service("left", {"boot"}),
        Service("right", {"boot"}),
        Service("tip", {"left", "right"}),
    }));

    ServiceGraphBuilder builder;
    auto ids = RegisterServices(config, builder);
    ServiceGraph graph = builder.Build();

    REQUIRE(ids.size() == 4);
    REQUIRE(ids["boot"] == 0);
    REQUIRE(ids["tip"] == 3);
    REQUIRE(graph.GetDependencies(ids["tip"]) == DependencySet{ids["left"], ids["right"]});
    REQUIRE(graph.TerminalServiceIds() == std::set<ServiceId>{ids["tip"]});

    const ServiceDefinition& boot = graph.GetDefinition(ids["boot"]);
    REQUIRE(boot.GetImage() == "example/boot:latest");
    REQUIRE(boot.GetPrimaryPort() == 9650);
    REQUIRE(boot.GetLivenessProbe().method == "health.getLiveness");
    REQUIRE(boot.RenderStartCommand({0, "service-0"}, {}) ==
            std::vector<std::string>{"/node", "--name=service-0"});
}

TEST_CASE("RegisterServices - unknown dependency", "[config]") {
    NetworkConfig config;
    ServiceConfig service;
    service.name = "orphan";
    service.image = "example/orphan:latest";
    service.rpc_port = 9650;
    service.liveness.method = "health";
    service.depends_on = {"missing"};
    config.services.push_back(service);

    ServiceGraphBuilder builder;
    REQUIRE_THROWS_AS(RegisterServices(config, builder), ConfigError);
    REQUIRE(builder.Size() == 0);
}

TEST_CASE("LoadNetworkConfig - files", "[config]") {
    const auto path = std::filesystem::temp_directory_path() /
                      ("svcnet_config_test_" + std::to_string(::getpid()) + ".json");

    SECTION("Valid file") {
        {
            std::ofstream out(path);
            out << Document({Service("boot"), Service("peer", {"boot"})}).dump(2);
        }
        NetworkConfig config = LoadNetworkConfig(path);
        REQUIRE(config.services.size() == 2);
        REQUIRE(config.services[1].name == "peer");
    }

    SECTION("Invalid JSON") {
        {
            std::ofstream out(path);
            out << "{ \"services\": [ ";
        }
        REQUIRE_THROWS_AS(LoadNetworkConfig(path), ConfigError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(LoadNetworkConfig(path.string() + ".missing"), ConfigError);
    }

    std::filesystem::remove(path);
}
