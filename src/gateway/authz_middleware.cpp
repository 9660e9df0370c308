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

// Bastion Authorization Middleware - Implementation

#include "authz_middleware.hpp"

#include <cassert>

#include "../core/logging.hpp"

namespace bastion::gateway {

PolicyMiddleware::PolicyMiddleware(std::shared_ptr<PolicyEngine> engine)
    : engine_(std::move(engine)) {
    assert(engine_ && "PolicyEngine must not be null");
}

MiddlewareResult PolicyMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    ctx.state = PipelineState::Authorizing;

    const core::Claims* claims = ctx.claims ? &*ctx.claims : nullptr;
    ctx.decision = engine_->decide(ctx.request->method, ctx.request->path, claims);

    auto* logger = logging::get_current_logger();
    assert(logger && "Logger must be initialized");
    LOG_DECISION(logger, to_string(ctx.decision->effect), http::to_string(ctx.request->method),
                 ctx.request->path, ctx.decision->allowed() ? 0 : 403,
                 claims && claims->username() ? *claims->username() : std::string(),
                 ctx.correlation_id);

    if (!ctx.decision->allowed()) {
        return send_403(ctx);
    }

    return MiddlewareResult::Continue;
}

MiddlewareResult PolicyMiddleware::send_403(RequestContext& ctx) const {
    ctx.state = PipelineState::Denied;
    if (ctx.decision && ctx.decision->is_default()) {
        ctx.reason = "no_matching_rule";
    } else {
        ctx.reason = "denied_by_rule";
    }

    if (ctx.response) {
        set_error_response(*ctx.response, http::StatusCode::Forbidden, "forbidden",
                           "Access denied");
    }

    return MiddlewareResult::Stop;
}

}  // namespace bastion::gateway
