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

// Bastion Pipeline - Implementation

#include "pipeline.hpp"

#include <cassert>
#include <nlohmann/json.hpp>

#include "../core/logging.hpp"

namespace bastion::gateway {

std::string_view to_string(PipelineState state) noexcept {
    switch (state) {
        case PipelineState::Received:
            return "received";
        case PipelineState::Verifying:
            return "verifying";
        case PipelineState::Unauthenticated:
            return "unauthenticated";
        case PipelineState::Verified:
            return "verified";
        case PipelineState::Authorizing:
            return "authorizing";
        case PipelineState::Denied:
            return "denied";
        case PipelineState::Routed:
            return "routed";
        case PipelineState::NoRoute:
            return "no_route";
        case PipelineState::Forwarding:
            return "forwarding";
        case PipelineState::UpstreamError:
            return "upstream_error";
        case PipelineState::Completed:
            return "completed";
    }
    return "unknown";
}

void set_error_response(http::Response& response, http::StatusCode status,
                        std::string_view error, std::string_view message) {
    response.status = status;
    response.body = nlohmann::json{{"error", error}, {"message", message}}.dump();
    response.set_header("Content-Type", "application/json");
}

// RouteMiddleware

RouteMiddleware::RouteMiddleware(std::shared_ptr<Router> router) : router_(std::move(router)) {
    assert(router_ && "Router must not be null");
}

MiddlewareResult RouteMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    auto target = router_->route(ctx.request->target());
    if (!target) {
        ctx.state = PipelineState::NoRoute;
        ctx.reason = "no_route";
        set_error_response(*ctx.response, http::StatusCode::NotFound, "not_found",
                           "No route for this path");

        auto* logger = logging::get_current_logger();
        assert(logger && "Logger must be initialized");
        LOG_DEBUG(logger, "No route: path={}, correlation_id={}", ctx.request->path,
                  ctx.correlation_id);
        return MiddlewareResult::Stop;
    }

    ctx.route = std::move(*target);
    ctx.state = PipelineState::Routed;
    return MiddlewareResult::Continue;
}

// RequestIdMiddleware

MiddlewareResult RequestIdMiddleware::process_response(ResponseContext& ctx) {
    if (ctx.response && !ctx.correlation_id.empty()) {
        ctx.response->set_header("X-Request-Id", ctx.correlation_id);
    }
    return MiddlewareResult::Continue;
}

// Pipeline implementation

void Pipeline::use(std::unique_ptr<Middleware> middleware) {
    middleware_.push_back(std::move(middleware));
}

MiddlewareResult Pipeline::execute_request(RequestContext& ctx) {
    for (auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_request(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error) {
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

MiddlewareResult Pipeline::execute_response(ResponseContext& ctx) {
    for (auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_response(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error) {
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

}  // namespace bastion::gateway
