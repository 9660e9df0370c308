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
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

#include <httplib.h>

#include "gateway/upstream.hpp"
#include "test_helpers.hpp"

using namespace bastion::gateway;
using namespace bastion::test;
using namespace std::chrono_literals;
using bastion::http::Method;
using bastion::http::StatusCode;

namespace {

Backend backend_at(uint16_t port, uint32_t max_retries = 1) {
    Backend backend;
    backend.name = "test-backend";
    backend.host = "127.0.0.1";
    backend.port = port;
    backend.connect_timeout = 500ms;
    backend.read_timeout = 1000ms;
    backend.max_retries = max_retries;
    return backend;
}

// Port that was just released, so nothing listens there
uint16_t closed_port() {
    httplib::Server server;
    return static_cast<uint16_t>(server.bind_to_any_port("127.0.0.1"));
}

}  // namespace

// ============================================================================
// Retry Policy Tests
// ============================================================================

TEST_CASE("Idempotent requests are retried on transport failures", "[upstream][retry]") {
    FakeBackendClient client;
    auto backend = backend_at(9000, 2);

    SECTION("GET gets max_retries extra attempts") {
        client.fail_with(UpstreamError::Unreachable);
        auto result = forward_with_retries(client, backend, make_request(Method::GET, "/"), {});
        REQUIRE_FALSE(result);
        REQUIRE(result.error == UpstreamError::Unreachable);
        REQUIRE(result.attempts == 3);
        REQUIRE(client.calls() == 3);
    }

    SECTION("Timeouts are retried too") {
        client.fail_with(UpstreamError::Timeout);
        auto result = forward_with_retries(client, backend, make_request(Method::PUT, "/"), {});
        REQUIRE(result.error == UpstreamError::Timeout);
        REQUIRE(client.calls() == 3);
    }

    SECTION("Recovery on a later attempt") {
        std::atomic<int> calls{0};
        client.set_handler([&calls](const Backend&, const bastion::http::Request&,
                                    const CancelCheck&) {
            if (calls.fetch_add(1) == 0) {
                return UpstreamResult::failure(UpstreamError::Unreachable);
            }
            bastion::http::Response response;
            response.body = "second time lucky";
            return UpstreamResult::success(std::move(response));
        });

        auto result = forward_with_retries(client, backend, make_request(Method::GET, "/"), {});
        REQUIRE(result);
        REQUIRE(result.attempts == 2);
        REQUIRE(result.response->body == "second time lucky");
    }

    SECTION("Bad responses are not retried") {
        client.fail_with(UpstreamError::BadResponse);
        auto result = forward_with_retries(client, backend, make_request(Method::GET, "/"), {});
        REQUIRE(result.error == UpstreamError::BadResponse);
        REQUIRE(client.calls() == 1);
    }

    SECTION("Successful responses are never retried, whatever the status") {
        client.set_handler([](const Backend&, const bastion::http::Request&, const CancelCheck&) {
            bastion::http::Response response;
            response.status = StatusCode::ServiceUnavailable;
            return UpstreamResult::success(std::move(response));
        });
        auto result = forward_with_retries(client, backend, make_request(Method::GET, "/"), {});
        REQUIRE(result);
        REQUIRE(result.response->status_code() == 503);
        REQUIRE(client.calls() == 1);
    }
}

TEST_CASE("Non-idempotent requests are sent once", "[upstream][retry]") {
    auto backend = backend_at(9000, 3);

    for (auto method : {Method::POST, Method::PATCH}) {
        FakeBackendClient fresh;
        fresh.fail_with(UpstreamError::Timeout);
        auto result = forward_with_retries(fresh, backend, make_request(method, "/orders"), {});
        REQUIRE(result.error == UpstreamError::Timeout);
        REQUIRE(result.attempts == 1);
        REQUIRE(fresh.calls() == 1);
    }
}

TEST_CASE("Retries stop once the client cancels", "[upstream][retry][cancel]") {
    FakeBackendClient client;
    std::atomic<bool> gone{false};
    client.set_handler([&gone](const Backend&, const bastion::http::Request&, const CancelCheck&) {
        gone.store(true);  // Client disconnects while the first attempt fails
        return UpstreamResult::failure(UpstreamError::Unreachable);
    });

    auto result = forward_with_retries(client, backend_at(9000, 3),
                                       make_request(Method::GET, "/"),
                                       [&gone]() { return gone.load(); });
    REQUIRE(result.error == UpstreamError::Cancelled);
    REQUIRE(client.calls() == 1);
}

TEST_CASE("Upstream error mapping", "[upstream]") {
    REQUIRE(to_status(UpstreamError::Unreachable) == StatusCode::BadGateway);
    REQUIRE(to_status(UpstreamError::BadResponse) == StatusCode::BadGateway);
    REQUIRE(to_status(UpstreamError::Timeout) == StatusCode::GatewayTimeout);
    REQUIRE(to_status(UpstreamError::Cancelled) == StatusCode::ClientClosedRequest);

    REQUIRE(to_reason(UpstreamError::Unreachable) == "upstream_unreachable");
    REQUIRE(to_reason(UpstreamError::Timeout) == "upstream_timeout");
    REQUIRE(to_reason(UpstreamError::Cancelled) == "client_cancelled");
    REQUIRE(to_reason(UpstreamError::BadResponse) == "upstream_bad_response");
}

// ============================================================================
// HTTP Backend Client Tests (loopback)
// ============================================================================

TEST_CASE("HTTP backend client forwards requests", "[upstream][http]") {
    TestBackend server([](httplib::Server& s) {
        s.Post("/echo", [](const httplib::Request& req, httplib::Response& res) {
            res.status = 201;
            res.set_header("X-Seen-User", req.get_header_value("X-Forwarded-User"));
            res.set_header("X-Seen-Query", req.get_param_value("q"));
            res.set_content(req.body, "application/json");
        });
    });

    HttpBackendClient client;
    auto request = make_request(Method::POST, "/echo?q=1");
    request.body = R"({"hello":"world"})";
    request.set_header("Content-Type", "application/json");
    request.set_header("X-Forwarded-User", "alice");
    request.set_header("Connection", "keep-alive");

    auto result = client.send(backend_at(server.port()), request, {});
    REQUIRE(result);
    REQUIRE(result.response->status_code() == 201);
    REQUIRE(result.response->body == R"({"hello":"world"})");
    REQUIRE(result.response->get_header("X-Seen-User") == "alice");
    REQUIRE(result.response->get_header("X-Seen-Query") == "1");
    REQUIRE(result.response->get_header("Content-Type") == "application/json");
    REQUIRE_FALSE(result.response->has_header("Content-Length"));
}

TEST_CASE("HTTP backend client failures", "[upstream][http][errors]") {
    HttpBackendClient client;

    SECTION("Nothing listening") {
        auto result = client.send(backend_at(closed_port()), make_request(Method::GET, "/"), {});
        REQUIRE(result.error == UpstreamError::Unreachable);
    }

    SECTION("Backend slower than the read timeout") {
        TestBackend server([](httplib::Server& s) {
            s.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
                std::this_thread::sleep_for(600ms);
                res.set_content("late", "text/plain");
            });
        });

        auto backend = backend_at(server.port());
        backend.read_timeout = 150ms;
        auto result = client.send(backend, make_request(Method::GET, "/slow"), {});
        REQUIRE(result.error == UpstreamError::Timeout);
    }

    SECTION("Client already gone") {
        auto result = client.send(backend_at(9), make_request(Method::GET, "/"),
                                  []() { return true; });
        REQUIRE(result.error == UpstreamError::Cancelled);
    }

    SECTION("Backend that trickles its body past the read timeout") {
        TestBackend server([](httplib::Server& s) {
            s.Get("/drip", [](const httplib::Request&, httplib::Response& res) {
                res.set_chunked_content_provider("text/plain",
                                                 [](size_t offset, httplib::DataSink& sink) {
                                                     if (offset >= 40) {
                                                         sink.done();
                                                         return true;
                                                     }
                                                     std::this_thread::sleep_for(50ms);
                                                     return sink.write("x", 1);
                                                 });
            });
        });

        // Every gap is far below the timeout; only the whole-attempt deadline can fire
        auto backend = backend_at(server.port());
        backend.read_timeout = 300ms;
        auto started = std::chrono::steady_clock::now();
        auto result = client.send(backend, make_request(Method::GET, "/drip"), {});
        REQUIRE(result.error == UpstreamError::Timeout);
        REQUIRE(std::chrono::steady_clock::now() - started < 1500ms);
    }

    SECTION("Client disconnects while the backend is silent") {
        TestBackend server([](httplib::Server& s) {
            s.Get("/silent", [](const httplib::Request&, httplib::Response& res) {
                std::this_thread::sleep_for(1500ms);
                res.set_content("late", "text/plain");
            });
        });

        auto backend = backend_at(server.port());
        backend.read_timeout = 1200ms;
        auto started = std::chrono::steady_clock::now();
        auto deadline = started + 100ms;
        auto result = client.send(backend, make_request(Method::GET, "/silent"),
                                  [deadline]() { return std::chrono::steady_clock::now() > deadline; });
        REQUIRE(result.error == UpstreamError::Cancelled);
        REQUIRE(std::chrono::steady_clock::now() - started < 600ms);
    }

    SECTION("Client disconnects while the backend works") {
        TestBackend server([](httplib::Server& s) {
            s.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
                std::this_thread::sleep_for(300ms);
                res.set_content("late", "text/plain");
            });
        });

        auto deadline = std::chrono::steady_clock::now() + 100ms;
        auto result = client.send(backend_at(server.port()), make_request(Method::GET, "/slow"),
                                  [deadline]() { return std::chrono::steady_clock::now() > deadline; });
        REQUIRE(result.error == UpstreamError::Cancelled);
    }
}
