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

// Bastion Server - Implementation

#include "server.hpp"

#include <httplib.h>

#include <cassert>
#include <chrono>

#include "../gateway/gateway.hpp"
#include "logging.hpp"

namespace bastion::core {

namespace {

// httplib injects connection details as pseudo headers
bool is_pseudo_header(std::string_view name) noexcept {
    return name == "REMOTE_ADDR" || name == "REMOTE_PORT" || name == "LOCAL_ADDR" ||
           name == "LOCAL_PORT";
}

// Methods httplib has handler tables for; anything else it answers 400 itself
bool is_dispatched_method(std::string_view method) noexcept {
    return method == "GET" || method == "HEAD" || method == "POST" || method == "PUT" ||
           method == "PATCH" || method == "DELETE" || method == "OPTIONS";
}

}  // namespace

uint32_t resolve_worker_threads(uint32_t configured) noexcept {
    if (configured != 0) {
        return configured;
    }
    uint32_t cpus = std::thread::hardware_concurrency();
    return cpus == 0 ? 1 : cpus;
}

Server::Server(control::ServerConfig config, std::shared_ptr<gateway::Gateway> gateway)
    : config_(std::move(config)),
      gateway_(std::move(gateway)),
      server_(std::make_unique<httplib::Server>()) {
    assert(gateway_ && "Gateway must not be null");

    uint32_t workers = resolve_worker_threads(config_.worker_threads);
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    server_->set_read_timeout(std::chrono::milliseconds(config_.read_timeout));
    server_->set_write_timeout(std::chrono::milliseconds(config_.write_timeout));
    server_->set_payload_max_length(config_.max_request_size);

    // Every method and every path goes through the gateway
    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        handle(req, res);
    };
    server_->Get(".*", handler);
    server_->Post(".*", handler);
    server_->Put(".*", handler);
    server_->Patch(".*", handler);
    server_->Delete(".*", handler);
    server_->Options(".*", handler);

    // TRACE, CONNECT and extension methods never reach a handler table
    server_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (is_dispatched_method(req.method)) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        if (http::parse_method(req.method) == http::Method::UNKNOWN) {
            // Could not be forwarded faithfully
            apply_response(gateway_->reject(to_request(req), http::StatusCode::MethodNotAllowed),
                           res);
        } else {
            handle(req, res);
        }
        return httplib::Server::HandlerResponse::Handled;
    });

    // Requests httplib refuses before any handler runs (oversized body, bad
    // framing) still get an access record. Gateway answers carry X-Request-Id.
    server_->set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (res.has_header("X-Request-Id")) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        auto response = gateway_->reject(to_request(req), static_cast<http::StatusCode>(res.status));
        apply_response(response, res);
        return httplib::Server::HandlerResponse::Handled;
    });
}

Server::~Server() {
    stop();
}

bool Server::start() {
    auto* logger = logging::get_current_logger();
    assert(logger && "Logger must be initialized");

    if (config_.listen_port == 0) {
        bound_port_ = server_->bind_to_any_port(config_.listen_address);
        if (bound_port_ <= 0) {
            LOG_ERROR(logger, "Failed to bind {}:<any>", config_.listen_address);
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.listen_address, config_.listen_port)) {
            LOG_ERROR(logger, "Failed to bind {}:{}", config_.listen_address, config_.listen_port);
            return false;
        }
        bound_port_ = config_.listen_port;
    }

    running_ = true;
    listener_ = std::thread([this] {
        if (!server_->listen_after_bind()) {
            auto* thread_logger = logging::get_current_logger();
            if (thread_logger) {
                LOG_ERROR(thread_logger, "Listener on port {} exited with an error", bound_port_);
            }
        }
        running_ = false;
    });

    LOG_INFO(logger, "Listening on {}:{} with {} worker threads", config_.listen_address,
             bound_port_, resolve_worker_threads(config_.worker_threads));
    return true;
}

void Server::stop() {
    if (server_) {
        server_->stop();
    }
    if (listener_.joinable()) {
        listener_.join();
    }
    running_ = false;
}

http::Request Server::to_request(const httplib::Request& req) {
    http::Request request;
    request.method = http::parse_method(req.method);

    // Raw target: routing and policy see the path exactly as sent
    std::string_view target = req.target.empty() ? std::string_view(req.path) : req.target;
    auto query_pos = target.find('?');
    request.path = std::string(target.substr(0, query_pos));
    if (query_pos != std::string_view::npos) {
        request.query = std::string(target.substr(query_pos + 1));
    }

    request.headers.reserve(req.headers.size());
    for (const auto& [name, value] : req.headers) {
        if (is_pseudo_header(name)) {
            continue;
        }
        request.headers.emplace_back(name, value);
    }

    request.body = req.body;
    request.client_ip = req.remote_addr;
    return request;
}

void Server::apply_response(const http::Response& response, httplib::Response& res) {
    res.status = response.status_code();
    for (const auto& [name, value] : response.headers) {
        res.set_header(name, value);
    }
    res.body = response.body;
}

void Server::handle(const httplib::Request& req, httplib::Response& res) {
    gateway::CancelCheck cancelled;
    if (req.is_connection_closed) {
        cancelled = [&req] { return req.is_connection_closed(); };
    }

    auto response = gateway_->handle(to_request(req), cancelled);
    apply_response(response, res);
}

}  // namespace bastion::core
