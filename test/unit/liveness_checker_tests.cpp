// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for LivenessChecker probing published ports over TCP

#include <catch2/catch_test_macros.hpp>
#include "network/port_allocator.hpp"
#include "orchestrator/liveness_checker.hpp"
#include "orchestrator/network_orchestrator.hpp"
#include "infra/fake_http_server.hpp"
#include "infra/fake_service.hpp"
#include "infra/mock_runtime.hpp"
#include <atomic>
#include <thread>

using namespace svcnet;
using namespace svcnet::orchestrator;
using svcnet::network::HttpResponse;
using svcnet::network::PortAllocator;
using svcnet::runtime::MockRuntime;
using svcnet::test::FakeTcpServer;
using svcnet::test::ReceivedRequest;
using json = nlohmann::json;

namespace {

HttpResponse Response(int status, const std::string& body) {
    HttpResponse response;
    response.status = status;
    response.body = body;
    return response;
}

boost::asio::ip::tcp::endpoint Loopback() {
    return boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0);
}

LivenessChecker FastChecker() {
    LivenessChecker::Config config;
    config.request_timeout = std::chrono::milliseconds(1000);
    return LivenessChecker(config);
}

} // namespace

TEST_CASE("LivenessChecker::BuildRequestBody", "[liveness]") {
    LivenessProbe probe;
    probe.method = "health.health";
    probe.params = {{"tags", json::array({"11111111111111111111111111111111LpoYY"})}};

    json body = json::parse(LivenessChecker::BuildRequestBody(probe));
    REQUIRE(body["jsonrpc"] == "2.0");
    REQUIRE(body["id"] == 1);
    REQUIRE(body["method"] == "health.health");
    REQUIRE(body["params"] == probe.params);
}

TEST_CASE("LivenessChecker::IsLiveResponse", "[liveness]") {
    REQUIRE(LivenessChecker::IsLiveResponse(
        Response(200, R"({"jsonrpc":"2.0","id":1,"result":{"healthy":true}})")));
    REQUIRE(LivenessChecker::IsLiveResponse(
        Response(200, R"({"jsonrpc":"2.0","id":1,"result":null,"error":null})")));

    REQUIRE_FALSE(LivenessChecker::IsLiveResponse(
        Response(503, R"({"jsonrpc":"2.0","id":1,"result":{}})")));
    REQUIRE_FALSE(LivenessChecker::IsLiveResponse(
        Response(200, R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"not found"}})")));
    REQUIRE_FALSE(LivenessChecker::IsLiveResponse(Response(200, R"({"jsonrpc":"2.0","id":1})")));
    REQUIRE_FALSE(LivenessChecker::IsLiveResponse(Response(200, "[1,2,3]")));
    REQUIRE_FALSE(LivenessChecker::IsLiveResponse(Response(200, "<html>")));
    REQUIRE_FALSE(LivenessChecker::IsLiveResponse(Response(200, "")));
}

TEST_CASE("LivenessChecker - probing a running network", "[liveness][socket]") {
    std::atomic<bool> healthy{false};
    FakeTcpServer server(Loopback(), [&healthy](const ReceivedRequest& request) {
        json call = json::parse(request.body, nullptr, false);
        if (call.is_discarded() || call.value("method", "") != "tip.isLive") {
            return FakeTcpServer::Respond(400, R"({"error":"bad request"})");
        }
        if (!healthy) {
            return FakeTcpServer::Respond(
                200, R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"bootstrapping"}})");
        }
        return FakeTcpServer::Respond(200, R"({"jsonrpc":"2.0","id":1,"result":{"healthy":true}})");
    });
    const uint16_t published = server.local_endpoint().port();

    // One terminal service whose primary port is published on the fake
    // server's port
    ServiceGraphBuilder builder;
    ServiceId tip = builder.AddService(MakeFakeService("tip", 9650), {});
    ServiceGraph graph = builder.Build();

    MockRuntime runtime;
    PortAllocator ports(published, published);
    NetworkOrchestrator orchestrator(runtime, ports);
    RunningNetwork network = orchestrator.CreateAndRun(graph);
    REQUIRE(network.Get(tip)->GetHostPort(9650) == published);

    LivenessChecker checker = FastChecker();

    SECTION("Unhealthy service is pending") {
        REQUIRE_FALSE(checker.IsLive(*network.Get(tip), graph.GetDefinition(tip).GetLivenessProbe()));
        REQUIRE(checker.PendingServices(graph, network) == std::set<ServiceId>{tip});
        REQUIRE_FALSE(checker.WaitUntilReady(graph, network, std::chrono::milliseconds(300),
                                             std::chrono::milliseconds(50)));
    }

    SECTION("Healthy service is live") {
        healthy = true;
        REQUIRE(checker.IsLive(*network.Get(tip), graph.GetDefinition(tip).GetLivenessProbe()));
        REQUIRE(checker.PendingServices(graph, network).empty());
        REQUIRE(checker.WaitUntilReady(graph, network, std::chrono::milliseconds(1000)));

        auto requests = server.requests();
        REQUIRE_FALSE(requests.empty());
        REQUIRE(requests.back().method == "POST");
        REQUIRE(requests.back().target == "/");
    }

    SECTION("Stop request cancels the wait") {
        std::atomic<bool> stop{false};
        std::thread requester([&stop] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            stop = true;
        });
        auto start = std::chrono::steady_clock::now();
        bool ready = checker.WaitUntilReady(graph, network, std::chrono::milliseconds(30000),
                                            std::chrono::milliseconds(5000),
                                            [&stop] { return stop.load(); });
        auto elapsed = std::chrono::steady_clock::now() - start;
        requester.join();
        REQUIRE_FALSE(ready);
        REQUIRE(elapsed < std::chrono::seconds(3));
    }

    SECTION("Service becoming healthy while waiting") {
        std::thread flip([&healthy] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            healthy = true;
        });
        bool ready = checker.WaitUntilReady(graph, network, std::chrono::milliseconds(5000),
                                            std::chrono::milliseconds(50));
        flip.join();
        REQUIRE(ready);
    }
}

TEST_CASE("LivenessChecker - unreachable service", "[liveness][socket]") {
    uint16_t port;
    {
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor closed(io, Loopback());
        port = closed.local_endpoint().port();
    }

    ServiceGraphBuilder builder;
    ServiceId only = builder.AddService(MakeFakeService("only"), {});
    ServiceGraph graph = builder.Build();

    MockRuntime runtime;
    PortAllocator ports(port, port);
    NetworkOrchestrator orchestrator(runtime, ports);
    RunningNetwork network = orchestrator.CreateAndRun(graph);

    LivenessChecker checker = FastChecker();
    REQUIRE_FALSE(checker.IsLive(*network.Get(only), graph.GetDefinition(only).GetLivenessProbe()));
    REQUIRE_FALSE(checker.WaitUntilReady(graph, network, std::chrono::milliseconds(200),
                                         std::chrono::milliseconds(50)));
}

TEST_CASE("LivenessChecker - default configuration", "[liveness]") {
    LivenessChecker::Config defaults;
    REQUIRE(defaults.host == "127.0.0.1");
    REQUIRE(defaults.request_timeout == std::chrono::milliseconds(2000));

    ServiceGraphBuilder builder;
    ServiceId only = builder.AddService(MakeFakeService("only"), {});
    ServiceGraph graph = builder.Build();
    RunningNetwork empty(graph.TerminalServiceIds());

    LivenessChecker checker;
    REQUIRE(checker.PendingServices(graph, empty) == std::set<ServiceId>{only});
}

TEST_CASE("LivenessChecker - only terminal services are probed", "[liveness]") {
    ServiceGraphBuilder builder;
    ServiceId root = builder.AddService(MakeFakeService("root"), {});
    ServiceId leaf = builder.AddService(MakeFakeService("leaf"), {root});
    ServiceGraph graph = builder.Build();

    // Empty network: the terminal service is missing, so it stays pending
    RunningNetwork empty(graph.TerminalServiceIds());
    LivenessChecker checker = FastChecker();
    REQUIRE(checker.PendingServices(graph, empty) == std::set<ServiceId>{leaf});
}
