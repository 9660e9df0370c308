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

// Bastion Pipeline - Header
// Two-phase middleware chain for request processing

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/jwt.hpp"
#include "../http/http.hpp"
#include "policy.hpp"
#include "router.hpp"
#include "upstream.hpp"

namespace bastion::gateway {

/// Request lifecycle
enum class PipelineState : uint8_t {
    Received,
    Verifying,
    Unauthenticated,  // terminal: 401
    Verified,
    Authorizing,
    Denied,  // terminal: 403
    Routed,
    NoRoute,  // terminal: 404
    Forwarding,
    UpstreamError,  // terminal: 502 / 504 / 499
    Completed,      // terminal: backend response relayed
};

[[nodiscard]] std::string_view to_string(PipelineState state) noexcept;

/// Request context (passed through middleware chain)
struct RequestContext {
    // Request/Response
    http::Request* request = nullptr;
    http::Response* response = nullptr;

    std::string correlation_id;

    // Connection info
    std::string client_ip;

    PipelineState state = PipelineState::Received;

    // Identity (set by JwtAuthMiddleware)
    std::optional<core::Claims> claims;
    std::optional<core::VerificationError> auth_error;

    // Authorization (set by PolicyMiddleware)
    std::optional<Decision> decision;

    // Routing (set by RouteMiddleware)
    std::optional<RouteTarget> route;

    // Audit reason for a terminal state (empty on success)
    std::string reason;

    // Timing
    std::chrono::steady_clock::time_point start_time;
};

/// Response context (passed through response middleware chain)
struct ResponseContext {
    // Request/Response
    http::Request* request = nullptr;
    http::Response* response = nullptr;

    std::string correlation_id;
    std::string client_ip;

    PipelineState state = PipelineState::Completed;

    // Backend (empty when the request never left the gateway)
    std::string backend;
    UpstreamError upstream_error = UpstreamError::None;

    // Timing
    std::chrono::steady_clock::time_point start_time;
};

/// Middleware result
enum class MiddlewareResult {
    Continue,  // Continue to next middleware
    Stop,      // Stop pipeline execution
    Error      // Error occurred
};

/// Middleware base class (Two-Phase: Request + Response)
class Middleware {
public:
    virtual ~Middleware() = default;

    /// Process request phase (before proxy to backend)
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_request(RequestContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Process response phase (after backend responds or a stage answered)
    /// Default implementation: do nothing, continue
    [[nodiscard]] virtual MiddlewareResult process_response(ResponseContext& ctx) {
        (void)ctx;
        return MiddlewareResult::Continue;
    }

    /// Get middleware name (for debugging)
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Route lookup (NoRoute answers 404, distinct from a policy deny)
class RouteMiddleware : public Middleware {
public:
    explicit RouteMiddleware(std::shared_ptr<Router> router);

    [[nodiscard]] MiddlewareResult process_request(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "RouteMiddleware"; }

private:
    std::shared_ptr<Router> router_;
};

/// Adds X-Request-Id to every response
class RequestIdMiddleware : public Middleware {
public:
    [[nodiscard]] MiddlewareResult process_response(ResponseContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "RequestIdMiddleware"; }
};

/// Middleware pipeline
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline() = default;

    // Non-copyable, movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) noexcept = default;
    Pipeline& operator=(Pipeline&&) noexcept = default;

    /// Add middleware to pipeline
    void use(std::unique_ptr<Middleware> middleware);

    /// Execute request phase (stops at the first middleware that answers)
    [[nodiscard]] MiddlewareResult execute_request(RequestContext& ctx);

    /// Execute response phase (after backend responds or a stage answered)
    [[nodiscard]] MiddlewareResult execute_response(ResponseContext& ctx);

    /// Get middleware count
    [[nodiscard]] size_t size() const noexcept { return middleware_.size(); }

    /// Clear all middleware
    void clear() { middleware_.clear(); }

private:
    std::vector<std::unique_ptr<Middleware>> middleware_;
};

/// Fill a response with a generic JSON error body (no verification details)
void set_error_response(http::Response& response, http::StatusCode status,
                        std::string_view error, std::string_view message);

}  // namespace bastion::gateway
