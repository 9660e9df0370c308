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

// Bastion Gateway Component Factory - Header
// Factory functions for building gateway components from configuration

#pragma once

#include <memory>
#include <vector>

#include "../control/config.hpp"
#include "../core/jwt.hpp"
#include "../core/key_resolver.hpp"
#include "audit.hpp"
#include "gateway.hpp"
#include "policy.hpp"
#include "router.hpp"
#include "upstream.hpp"

namespace bastion::gateway {

/// Convert configured rules (throws std::invalid_argument on unknown values)
[[nodiscard]] std::vector<Rule> build_rules(const control::PolicyConfig& config);

/// Convert configured routes
[[nodiscard]] std::vector<Route> build_routes(const std::vector<control::RouteConfig>& config);

/// Convert configured backends
[[nodiscard]] std::vector<Backend> build_backends(const std::vector<control::BackendConfig>& config);

/// Token verifier settings from the identity section
[[nodiscard]] core::VerifierConfig build_verifier_config(const control::IdentityConfig& config);

/// Key resolver with static keys and the JWKS source (throws when a static key fails to load)
[[nodiscard]] std::shared_ptr<core::KeyResolver> build_key_resolver(
    const control::IdentityConfig& config);

/// Audit sink from the audit section
[[nodiscard]] std::shared_ptr<AuditSink> build_audit_sink(const control::AuditConfig& config);

/// Gateway forwarding and authentication settings
[[nodiscard]] Gateway::Config build_gateway_config(const control::Config& config);

/// Assemble the whole gateway (throws on invalid configuration)
[[nodiscard]] std::unique_ptr<Gateway> build_gateway(
    const control::Config& config, std::shared_ptr<core::KeyResolver> keys,
    std::shared_ptr<BackendClient> backend_client = std::make_shared<HttpBackendClient>(),
    std::shared_ptr<AuditSink> audit_sink = nullptr);

}  // namespace bastion::gateway
