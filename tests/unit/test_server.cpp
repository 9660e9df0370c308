/*
 * Copyright 2025 Bastion Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <vector>

#include <httplib.h>

#include "core/server.hpp"
#include "gateway/gateway.hpp"
#include "test_helpers.hpp"

using namespace bastion::test;
using bastion::core::Server;
using bastion::http::Method;

namespace {

std::shared_ptr<bastion::gateway::Gateway> make_gateway(
    std::shared_ptr<FakeBackendClient> client, std::shared_ptr<RecordingAuditSink> sink) {
    using namespace bastion::gateway;

    Rule alice;
    alice.id = "alice-own";
    alice.path = "/alice";
    alice.principal = UsernameEquals{"alice"};

    Backend backend;
    backend.name = "alice-api";
    backend.host = "10.0.0.1";
    backend.port = 8080;

    GatewayComponents components;
    components.verifier = make_verifier();
    components.policy = std::make_shared<PolicyEngine>(std::vector<Rule>{alice});
    components.router = std::make_shared<Router>(std::vector<Route>{{"/alice", "alice-api", "/"}});
    components.backend_client = std::move(client);
    components.audit = std::make_shared<AuditLogger>(std::move(sink));
    components.backends = {backend};

    return std::make_shared<Gateway>(Gateway::Config{}, std::move(components));
}

bastion::control::ServerConfig loopback_config() {
    bastion::control::ServerConfig config;
    config.listen_address = "127.0.0.1";
    config.listen_port = 0;
    config.worker_threads = 2;
    return config;
}

}  // namespace

TEST_CASE("Server serves requests through the gateway", "[server]") {
    auto client = std::make_shared<FakeBackendClient>();
    auto sink = std::make_shared<RecordingAuditSink>();

    Server server(loopback_config(), make_gateway(client, sink));
    REQUIRE(server.start());
    REQUIRE(server.is_running());
    REQUIRE(server.bound_port() > 0);

    httplib::Client http("127.0.0.1", server.bound_port());

    SECTION("Authorized request reaches the backend") {
        auto token = sign_token(rsa_key(), "RS256", "rsa-1", claims_for("alice"));
        auto res = http.Get("/alice/profile?full=1", {{"Authorization", "Bearer " + token}});
        REQUIRE(res);
        REQUIRE(res->status == 200);
        REQUIRE(res->body == "hello from /profile");
        REQUIRE_FALSE(res->get_header_value("X-Request-Id").empty());

        REQUIRE(client->calls() == 1);
        auto sent = client->requests().front();
        REQUIRE(sent.query == "full=1");
        REQUIRE(sent.get_header("X-Forwarded-User") == "alice");
        REQUIRE(sent.get_header("X-Forwarded-For") == "127.0.0.1");
    }

    SECTION("Missing token") {
        auto res = http.Get("/alice");
        REQUIRE(res);
        REQUIRE(res->status == 401);
        REQUIRE(res->get_header_value("WWW-Authenticate") == "Bearer realm=\"bastion\"");
        REQUIRE(client->calls() == 0);
        REQUIRE(sink->last()["reason"] == "missing");
    }

    SECTION("Every method goes through the pipeline") {
        auto res = http.Delete("/alice/1");
        REQUIRE(res);
        REQUIRE(res->status == 401);

        res = http.Post("/alice", "{}", "application/json");
        REQUIRE(res);
        REQUIRE(res->status == 401);
        REQUIRE(sink->size() == 2);
    }

    SECTION("Methods without an httplib handler table reach the gateway") {
        httplib::Request trace;
        trace.method = "TRACE";
        trace.path = "/alice";
        auto res = http.send(trace);
        REQUIRE(res);
        REQUIRE(res->status == 401);
        REQUIRE(sink->size() == 1);
        REQUIRE(sink->last()["method"] == "TRACE");
        REQUIRE(sink->last()["reason"] == "missing");
    }

    SECTION("Unknown methods are refused and recorded") {
        httplib::Request propfind;
        propfind.method = "PROPFIND";
        propfind.path = "/alice";
        auto res = http.send(propfind);
        REQUIRE(res);
        REQUIRE(res->status == 405);
        REQUIRE_FALSE(res->get_header_value("X-Request-Id").empty());
        REQUIRE(sink->size() == 1);
        REQUIRE(sink->last()["status"] == 405);
        REQUIRE(sink->last()["decision"] == "deny");
        REQUIRE(sink->last()["reason"] == "method_not_allowed");
        REQUIRE(client->calls() == 0);
    }

    server.stop();
    REQUIRE_FALSE(server.is_running());
}

TEST_CASE("Server records requests it refuses before routing", "[server]") {
    auto client = std::make_shared<FakeBackendClient>();
    auto sink = std::make_shared<RecordingAuditSink>();

    auto config = loopback_config();
    config.max_request_size = 16;
    Server server(config, make_gateway(client, sink));
    REQUIRE(server.start());

    httplib::Client http("127.0.0.1", server.bound_port());
    auto token = sign_token(rsa_key(), "RS256", "rsa-1", claims_for("alice"));
    auto res = http.Post("/alice/upload", {{"Authorization", "Bearer " + token}},
                         std::string(64, 'x'), "text/plain");
    REQUIRE(res);
    REQUIRE(res->status == 413);
    REQUIRE_FALSE(res->get_header_value("X-Request-Id").empty());

    REQUIRE(client->calls() == 0);
    REQUIRE(sink->size() == 1);
    REQUIRE(sink->last()["status"] == 413);
    REQUIRE(sink->last()["decision"] == "deny");
    REQUIRE(sink->last()["reason"] == "payload_too_large");
    REQUIRE(sink->last()["path"] == "/alice/upload");

    server.stop();
}

TEST_CASE("Inbound request conversion", "[server]") {
    httplib::Request req;
    req.method = "GET";
    req.path = "/alice/docs";
    req.target = "/alice/%2e%2e/bob?x=1";
    req.remote_addr = "198.51.100.7";
    req.body = "payload";
    req.headers.emplace("Authorization", "Bearer abc");
    req.headers.emplace("REMOTE_ADDR", "198.51.100.7");
    req.headers.emplace("LOCAL_PORT", "8080");

    auto request = Server::to_request(req);
    REQUIRE(request.method == Method::GET);
    REQUIRE(request.path == "/alice/%2e%2e/bob");
    REQUIRE(request.query == "x=1");
    REQUIRE(request.client_ip == "198.51.100.7");
    REQUIRE(request.body == "payload");
    REQUIRE(request.get_header("Authorization") == "Bearer abc");
    REQUIRE_FALSE(request.has_header("REMOTE_ADDR"));
    REQUIRE_FALSE(request.has_header("LOCAL_PORT"));
}

TEST_CASE("Outbound response conversion", "[server]") {
    bastion::http::Response response;
    response.status = bastion::http::StatusCode::Forbidden;
    response.set_header("Content-Type", "application/json");
    response.body = R"({"error":"forbidden"})";

    httplib::Response res;
    Server::apply_response(response, res);
    REQUIRE(res.status == 403);
    REQUIRE(res.get_header_value("Content-Type") == "application/json");
    REQUIRE(res.body == R"({"error":"forbidden"})");
}

TEST_CASE("Worker thread count", "[server]") {
    REQUIRE(bastion::core::resolve_worker_threads(4) == 4);
    REQUIRE(bastion::core::resolve_worker_threads(0) >= 1);
}
