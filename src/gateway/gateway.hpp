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

// Bastion Gateway - Header
// Per-request orchestration: verify, authorize, route, forward, audit

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "../core/containers.hpp"
#include "../core/jwt.hpp"
#include "../http/http.hpp"
#include "audit.hpp"
#include "jwt_middleware.hpp"
#include "pipeline.hpp"
#include "policy.hpp"
#include "router.hpp"
#include "upstream.hpp"

namespace bastion::gateway {

/// Identity headers added to forwarded requests
struct ForwardingOptions {
    bool strip_authorization = true;
    std::string user_header = "X-Forwarded-User";
    std::string roles_header = "X-Forwarded-Roles";
    std::string claims_header = "X-Jwt-Payload";  // Empty = not forwarded
    bool claims_as_json = false;                  // false = base64 of the payload
};

/// Shared components a gateway is assembled from
struct GatewayComponents {
    std::shared_ptr<core::TokenVerifier> verifier;
    std::shared_ptr<PolicyEngine> policy;
    std::shared_ptr<Router> router;
    std::shared_ptr<BackendClient> backend_client;
    std::shared_ptr<AuditLogger> audit;
    std::vector<Backend> backends;
};

/// Gateway
/// handle() is safe to call from many threads at once; the only shared mutable
/// state is behind the key resolver, policy and router snapshots.
class Gateway {
public:
    struct Config {
        JwtAuthMiddleware::Config auth;
        ForwardingOptions forwarding;
    };

    /// Throws std::invalid_argument when a component is missing
    Gateway(Config config, GatewayComponents components);
    ~Gateway() = default;

    // Non-copyable, non-movable
    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;
    Gateway(Gateway&&) = delete;
    Gateway& operator=(Gateway&&) = delete;

    /// Process one request end to end. Always returns a response and always
    /// writes exactly one access record.
    [[nodiscard]] http::Response handle(http::Request request, const CancelCheck& cancelled = {});

    /// Answer a request the listener refused before it could be handled
    /// (oversized body, bad framing, unknown method). Writes one deny record.
    [[nodiscard]] http::Response reject(const http::Request& request, http::StatusCode status);

    /// Swap in a new rule list (old one kept on failure)
    [[nodiscard]] bool reload_policy(std::vector<Rule> rules);

    /// Swap in a new route table; every backend must already be known
    [[nodiscard]] bool reload_routes(std::vector<Route> routes);

    [[nodiscard]] const PolicyEngine& policy() const noexcept { return *components_.policy; }
    [[nodiscard]] const Router& router() const noexcept { return *components_.router; }

    /// The request the backend will see (identity headers set, spoofed copies removed)
    [[nodiscard]] http::Request build_forward_request(const http::Request& request,
                                                      const RequestContext& ctx) const;

private:
    /// Forwarding stage: backend call with retries
    void forward(RequestContext& ctx, ResponseContext& response_ctx, const CancelCheck& cancelled);

    /// Copy the outcome of the request into the access record
    void fill_record(AccessRecord& record, const RequestContext& ctx,
                     const http::Response& response) const;

    Config config_;
    GatewayComponents components_;
    core::string_map<Backend> backends_;

    Pipeline request_pipeline_;
    Pipeline response_pipeline_;
};

}  // namespace bastion::gateway
