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

// Bastion JWT Authentication Middleware - Implementation

#include "jwt_middleware.hpp"

#include <cassert>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace bastion::gateway {

JwtAuthMiddleware::JwtAuthMiddleware(Config config, std::shared_ptr<core::TokenVerifier> verifier)
    : config_(std::move(config)), verifier_(std::move(verifier)) {
    assert(verifier_ && "TokenVerifier must not be null");
}

std::optional<std::string_view> JwtAuthMiddleware::extract_token(
    std::string_view header_value) const {
    // "<scheme> <token>", scheme case-insensitive (RFC 7235)
    auto space = header_value.find(' ');
    if (space == std::string_view::npos) {
        return std::nullopt;
    }

    if (!core::iequals(header_value.substr(0, space), config_.scheme)) {
        return std::nullopt;
    }

    std::string_view token = header_value.substr(space + 1);
    while (!token.empty() && token.front() == ' ') {
        token.remove_prefix(1);
    }
    while (!token.empty() && token.back() == ' ') {
        token.remove_suffix(1);
    }

    if (token.empty() || token.find(' ') != std::string_view::npos) {
        return std::nullopt;
    }
    return token;
}

MiddlewareResult JwtAuthMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    ctx.state = PipelineState::Verifying;

    // STEP 1: Extract token (absent or malformed header counts as a missing token)
    auto auth_header = ctx.request->get_header(config_.header);
    auto token = extract_token(auth_header);
    if (!token) {
        return send_401(ctx, core::VerificationError::Missing);
    }

    // STEP 2: Verify signature and claims
    auto result = verifier_->verify(*token);
    if (!result) {
        auto* logger = logging::get_current_logger();
        assert(logger && "Logger must be initialized");
        LOG_WARNING(logger, "JWT verification failed: error={}, client_ip={}, correlation_id={}",
                    core::to_string(result.error), ctx.client_ip, ctx.correlation_id);

        return send_401(ctx, result.error);
    }

    // STEP 3: Store claims in context for the policy stage
    ctx.claims = std::move(result.claims);
    ctx.state = PipelineState::Verified;

    auto* logger = logging::get_current_logger();
    assert(logger && "Logger must be initialized");
    LOG_DEBUG(logger, "JWT verified: sub={}, client_ip={}, correlation_id={}",
              ctx.claims->subject(), ctx.client_ip, ctx.correlation_id);

    return MiddlewareResult::Continue;
}

MiddlewareResult JwtAuthMiddleware::send_401(RequestContext& ctx,
                                             core::VerificationError error) const {
    ctx.state = PipelineState::Unauthenticated;
    ctx.auth_error = error;
    ctx.reason = std::string(core::to_string(error));

    if (ctx.response) {
        // Generic body: the failure reason goes to the audit record only
        set_error_response(*ctx.response, http::StatusCode::Unauthorized, "unauthorized",
                           "Authentication required");

        // Add WWW-Authenticate header (RFC 6750)
        ctx.response->set_header("WWW-Authenticate",
                                 config_.scheme + " realm=\"" + config_.realm + "\"");
    }

    return MiddlewareResult::Stop;
}

}  // namespace bastion::gateway
