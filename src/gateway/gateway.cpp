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

// Bastion Gateway - Implementation

#include "gateway.hpp"

#include <algorithm>
#include <cassert>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "authz_middleware.hpp"

namespace bastion::gateway {

namespace {

// Claim values end up in header values: refuse anything that could split a header
bool is_safe_header_value(std::string_view value) noexcept {
    return std::none_of(value.begin(), value.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return (uc < 0x20 && c != '\t') || uc == 0x7f;
    });
}

void remove_hop_by_hop_headers(http::Request& request) {
    // Headers named by Connection are hop-by-hop as well (RFC 9110 section 7.6.1)
    std::string connection(request.get_header("Connection"));
    for (auto name : core::split(connection, ',')) {
        while (!name.empty() && name.front() == ' ') {
            name.remove_prefix(1);
        }
        while (!name.empty() && name.back() == ' ') {
            name.remove_suffix(1);
        }
        if (!name.empty()) {
            request.remove_header(name);
        }
    }

    std::erase_if(request.headers,
                  [](const http::Header& h) { return http::is_hop_by_hop_header(h.first); });
}

}  // namespace

Gateway::Gateway(Config config, GatewayComponents components)
    : config_(std::move(config)), components_(std::move(components)) {
    if (!components_.verifier || !components_.policy || !components_.router ||
        !components_.backend_client || !components_.audit) {
        throw std::invalid_argument("gateway requires verifier, policy, router, backend client "
                                    "and audit logger");
    }

    for (const auto& backend : components_.backends) {
        backends_.insert_or_assign(backend.name, backend);
    }

    // Request phase: verify -> authorize -> route
    request_pipeline_.use(std::make_unique<JwtAuthMiddleware>(config_.auth, components_.verifier));
    request_pipeline_.use(std::make_unique<PolicyMiddleware>(components_.policy));
    request_pipeline_.use(std::make_unique<RouteMiddleware>(components_.router));

    // Response phase
    response_pipeline_.use(std::make_unique<RequestIdMiddleware>());
}

http::Response Gateway::handle(http::Request request, const CancelCheck& cancelled) {
    http::Response response;

    RequestContext ctx;
    ctx.request = &request;
    ctx.response = &response;
    ctx.correlation_id = logging::generate_correlation_id();
    ctx.client_ip = request.client_ip;
    ctx.start_time = std::chrono::steady_clock::now();

    ResponseContext response_ctx;
    response_ctx.request = &request;
    response_ctx.response = &response;
    response_ctx.correlation_id = ctx.correlation_id;
    response_ctx.client_ip = ctx.client_ip;
    response_ctx.start_time = ctx.start_time;

    AccessRecord initial;
    initial.request_id = ctx.correlation_id;
    initial.method = std::string(http::to_string(request.method));
    initial.path = request.path;
    AuditScope audit(*components_.audit, std::move(initial));

    try {
        auto result = request_pipeline_.execute_request(ctx);
        if (result == MiddlewareResult::Continue) {
            forward(ctx, response_ctx, cancelled);
        } else if (result == MiddlewareResult::Error) {
            ctx.reason = "internal_error";
            set_error_response(response, http::StatusCode::InternalServerError, "internal_error",
                               "Internal server error");
        }

        response_ctx.state = ctx.state;
        (void)response_pipeline_.execute_response(response_ctx);
    } catch (const std::exception& e) {
        auto* logger = logging::get_current_logger();
        assert(logger && "Logger must be initialized");
        LOG_ERROR_CTX(logger, "Request processing failed", ctx.correlation_id, "internal_error",
                      e.what());

        ctx.reason = "internal_error";
        response = http::Response{};
        set_error_response(response, http::StatusCode::InternalServerError, "internal_error",
                           "Internal server error");
        response.set_header("X-Request-Id", ctx.correlation_id);
    }

    fill_record(audit.record(), ctx, response);
    audit.commit();

    return response;
}

http::Response Gateway::reject(const http::Request& request, http::StatusCode status) {
    std::string correlation_id = logging::generate_correlation_id();

    AccessRecord initial;
    initial.request_id = correlation_id;
    initial.method = std::string(http::to_string(request.method));
    initial.path = request.path;
    AuditScope audit(*components_.audit, std::move(initial));

    http::Response response;
    if (status == http::StatusCode::PayloadTooLarge) {
        set_error_response(response, status, "payload_too_large", "Request body too large");
        audit.record().reason = "payload_too_large";
    } else if (status == http::StatusCode::MethodNotAllowed) {
        set_error_response(response, status, "method_not_allowed", "Unsupported method");
        audit.record().reason = "method_not_allowed";
    } else {
        set_error_response(response, status, "bad_request", "Malformed request");
        audit.record().reason = "bad_request";
    }
    response.set_header("X-Request-Id", correlation_id);

    audit.record().status = response.status_code();
    audit.record().decision = AuditDecision::Deny;
    audit.commit();

    auto* logger = logging::get_current_logger();
    assert(logger && "Logger must be initialized");
    LOG_DEBUG(logger, "Request refused by the listener: status={}, path={}, correlation_id={}",
              response.status_code(), request.path, correlation_id);
    return response;
}

void Gateway::forward(RequestContext& ctx, ResponseContext& response_ctx,
                      const CancelCheck& cancelled) {
    auto& response = *ctx.response;
    auto* logger = logging::get_current_logger();
    assert(logger && "Logger must be initialized");

    auto it = backends_.find(ctx.route->backend);
    if (it == backends_.end()) {
        // Routes are validated against the backend list, so this is a config bug
        LOG_ERROR_CTX(logger, "Route references unknown backend", ctx.correlation_id,
                      "unknown_backend", ctx.route->backend);
        ctx.state = PipelineState::UpstreamError;
        ctx.reason = std::string(to_reason(UpstreamError::Unreachable));
        set_error_response(response, http::StatusCode::BadGateway, "bad_gateway",
                           "Backend unavailable");
        return;
    }
    const Backend& backend = it->second;

    ctx.state = PipelineState::Forwarding;
    response_ctx.backend = backend.name;

    http::Request upstream_request = build_forward_request(*ctx.request, ctx);
    auto result = forward_with_retries(*components_.backend_client, backend, upstream_request,
                                       cancelled);

    if (!result) {
        ctx.state = PipelineState::UpstreamError;
        ctx.reason = std::string(to_reason(result.error));
        response_ctx.upstream_error = result.error;

        LOG_UPSTREAM(logger, to_reason(result.error), backend.name, backend.host, backend.port,
                     ctx.correlation_id);

        switch (result.error) {
            case UpstreamError::Timeout:
                set_error_response(response, http::StatusCode::GatewayTimeout, "gateway_timeout",
                                   "Backend timed out");
                break;
            case UpstreamError::Cancelled:
                set_error_response(response, http::StatusCode::ClientClosedRequest,
                                   "client_closed_request", "Client closed request");
                break;
            default:
                set_error_response(response, to_status(result.error), "bad_gateway",
                                   "Backend unavailable");
                break;
        }
        return;
    }

    response = std::move(*result.response);
    ctx.state = PipelineState::Completed;
}

http::Request Gateway::build_forward_request(const http::Request& request,
                                             const RequestContext& ctx) const {
    const auto& fwd = config_.forwarding;
    http::Request upstream = request;

    // Rewritten target ("/path?query")
    if (ctx.route) {
        std::string_view target = ctx.route->path;
        auto query_pos = target.find('?');
        upstream.path = std::string(target.substr(0, query_pos));
        upstream.query = query_pos == std::string_view::npos
                             ? std::string()
                             : std::string(target.substr(query_pos + 1));
    }

    remove_hop_by_hop_headers(upstream);

    // Clients never get to set identity headers themselves
    upstream.remove_header(fwd.user_header);
    upstream.remove_header(fwd.roles_header);
    if (!fwd.claims_header.empty()) {
        upstream.remove_header(fwd.claims_header);
    }
    upstream.remove_header("X-Request-Id");

    if (fwd.strip_authorization) {
        upstream.remove_header(config_.auth.header);
    }

    if (ctx.claims) {
        const auto& claims = *ctx.claims;

        if (claims.username() && is_safe_header_value(*claims.username())) {
            upstream.set_header(fwd.user_header, *claims.username());
        }

        if (!claims.roles().empty()) {
            std::string roles = core::join(claims.roles(), ",");
            if (is_safe_header_value(roles)) {
                upstream.set_header(fwd.roles_header, roles);
            }
        }

        if (!fwd.claims_header.empty()) {
            if (fwd.claims_as_json) {
                // Re-serialized compactly so the value stays on one line
                auto payload = nlohmann::json::parse(claims.raw_payload(), nullptr, false);
                if (!payload.is_discarded()) {
                    upstream.set_header(
                        fwd.claims_header,
                        payload.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace));
                }
            } else {
                upstream.set_header(fwd.claims_header, core::base64_encode(claims.raw_payload()));
            }
        }
    }

    upstream.set_header("X-Request-Id", ctx.correlation_id);

    // Append to an existing chain
    if (!request.client_ip.empty()) {
        auto existing = upstream.get_header("X-Forwarded-For");
        std::string chain = existing.empty() ? request.client_ip
                                             : std::string(existing) + ", " + request.client_ip;
        upstream.set_header("X-Forwarded-For", chain);
    }

    return upstream;
}

void Gateway::fill_record(AccessRecord& record, const RequestContext& ctx,
                          const http::Response& response) const {
    record.status = response.status_code();

    switch (ctx.state) {
        case PipelineState::Received:
        case PipelineState::Verifying:
        case PipelineState::Unauthenticated:
            record.decision = ctx.auth_error ? AuditDecision::Unauthenticated : AuditDecision::Deny;
            break;
        default:
            record.decision = ctx.decision && ctx.decision->allowed() ? AuditDecision::Allow
                                                                       : AuditDecision::Deny;
            break;
    }

    if (!ctx.reason.empty()) {
        record.reason = ctx.reason;
    }

    if (ctx.decision && !ctx.decision->rule_id.empty()) {
        record.rule_id = ctx.decision->rule_id;
    }

    // Identity is recorded whenever verification succeeded
    if (ctx.claims) {
        const auto& claims = *ctx.claims;
        if (!claims.subject().empty()) {
            record.subject = claims.subject();
        }
        record.username = claims.username();
        record.roles.assign(claims.roles().begin(), claims.roles().end());
    }

    if (ctx.route) {
        record.backend = ctx.route->backend;
    }
}

bool Gateway::reload_policy(std::vector<Rule> rules) {
    return components_.policy->reload(std::move(rules));
}

bool Gateway::reload_routes(std::vector<Route> routes) {
    for (const auto& route : routes) {
        if (!backends_.contains(route.backend)) {
            auto* logger = logging::get_current_logger();
            assert(logger && "Logger must be initialized");
            LOG_ERROR(logger, "Route reload rejected: route '{}' references unknown backend '{}'",
                      route.prefix, route.backend);
            return false;
        }
    }
    return components_.router->reload(std::move(routes));
}

}  // namespace bastion::gateway
