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

// Bastion Server - Header
// Inbound HTTP listener handing every request to the gateway

#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "../control/config.hpp"
#include "../http/http.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}  // namespace httplib

namespace bastion::gateway {
class Gateway;
}

namespace bastion::core {

/// HTTP server (cpp-httplib with a fixed worker pool, one request per task)
class Server {
public:
    Server(control::ServerConfig config, std::shared_ptr<gateway::Gateway> gateway);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    /// Bind and start serving on a background thread
    [[nodiscard]] bool start();

    /// Stop accepting, finish in-flight requests, join the listener thread
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Port actually bound (useful with listen_port 0 in tests)
    [[nodiscard]] int bound_port() const noexcept { return bound_port_; }

    /// Convert an inbound httplib request to the gateway's value type
    [[nodiscard]] static http::Request to_request(const httplib::Request& req);

    /// Copy a gateway response onto the httplib response
    static void apply_response(const http::Response& response, httplib::Response& res);

private:
    void handle(const httplib::Request& req, httplib::Response& res);

    control::ServerConfig config_;
    std::shared_ptr<gateway::Gateway> gateway_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listener_;
    std::atomic<bool> running_{false};
    int bound_port_ = 0;
};

/// Worker count for a configured value (0 = hardware concurrency)
[[nodiscard]] uint32_t resolve_worker_threads(uint32_t configured) noexcept;

}  // namespace bastion::core
