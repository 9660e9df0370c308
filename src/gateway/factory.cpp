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

// Bastion Gateway Component Factory - Implementation

#include "factory.hpp"

#include <stdexcept>

#include "../core/logging.hpp"

namespace bastion::gateway {

namespace {

Principal build_principal(const control::RuleConfig& rule) {
    const auto& p = rule.principal;
    if (p.type == "authenticated") {
        return AnyAuthenticated{};
    }
    if (p.type == "username") {
        return UsernameEquals{p.value};
    }
    if (p.type == "role") {
        return RoleContains{p.value};
    }
    throw std::invalid_argument("rule '" + rule.id + "' has unknown principal type '" + p.type +
                                "'");
}

}  // namespace

std::vector<Rule> build_rules(const control::PolicyConfig& config) {
    std::vector<Rule> rules;
    rules.reserve(config.rules.size());

    for (const auto& rule_config : config.rules) {
        Rule rule;
        rule.id = rule_config.id;
        rule.path = rule_config.path;

        if (rule_config.effect == "allow") {
            rule.effect = Effect::Allow;
        } else if (rule_config.effect == "deny") {
            rule.effect = Effect::Deny;
        } else {
            throw std::invalid_argument("rule '" + rule.id + "' has unknown effect '" +
                                        rule_config.effect + "'");
        }

        if (rule_config.match == "prefix") {
            rule.match = PathMatch::Prefix;
        } else if (rule_config.match == "exact") {
            rule.match = PathMatch::Exact;
        } else {
            throw std::invalid_argument("rule '" + rule.id + "' has unknown match '" +
                                        rule_config.match + "'");
        }

        for (const auto& method : rule_config.methods) {
            rule.methods.push_back(http::parse_method(method));
        }

        rule.principal = build_principal(rule_config);
        rules.push_back(std::move(rule));
    }

    return rules;
}

std::vector<Route> build_routes(const std::vector<control::RouteConfig>& config) {
    std::vector<Route> routes;
    routes.reserve(config.size());
    for (const auto& route_config : config) {
        routes.push_back(Route{route_config.prefix, route_config.backend, route_config.rewrite});
    }
    return routes;
}

std::vector<Backend> build_backends(const std::vector<control::BackendConfig>& config) {
    std::vector<Backend> backends;
    backends.reserve(config.size());
    for (const auto& backend_config : config) {
        Backend backend;
        backend.name = backend_config.name;
        backend.host = backend_config.host;
        backend.port = backend_config.port;
        backend.connect_timeout = std::chrono::milliseconds(backend_config.connect_timeout_ms);
        backend.read_timeout = std::chrono::milliseconds(backend_config.read_timeout_ms);
        backend.max_retries = backend_config.max_retries;
        backends.push_back(std::move(backend));
    }
    return backends;
}

core::VerifierConfig build_verifier_config(const control::IdentityConfig& config) {
    core::VerifierConfig verifier_config;
    verifier_config.issuer = config.issuer;
    verifier_config.audiences = config.audiences;
    verifier_config.clock_skew_seconds = config.clock_skew_seconds;
    verifier_config.username_claim = config.username_claim;
    verifier_config.roles_claim = config.roles_claim;
    verifier_config.username_fallback_to_subject = config.username_fallback_to_subject;

    verifier_config.algorithms.clear();
    for (const auto& name : config.algorithms) {
        auto alg = core::parse_algorithm(name);
        if (!alg) {
            throw std::invalid_argument("algorithm '" + name + "' is not allowed");
        }
        verifier_config.algorithms.push_back(*alg);
    }

    return verifier_config;
}

std::shared_ptr<core::KeyResolver> build_key_resolver(const control::IdentityConfig& config) {
    std::vector<core::SigningKey> static_keys;
    for (const auto& key_config : config.keys) {
        std::optional<core::JwtAlgorithm> alg;
        if (!key_config.algorithm.empty()) {
            alg = core::parse_algorithm(key_config.algorithm);
            if (!alg) {
                throw std::invalid_argument("static key '" + key_config.key_id +
                                            "' has unknown algorithm '" + key_config.algorithm +
                                            "'");
            }
        }

        auto key = core::SigningKey::load_public_key(alg, key_config.key_id,
                                                     key_config.public_key_path);
        if (!key) {
            throw std::invalid_argument("cannot load public key '" + key_config.public_key_path +
                                        "'");
        }
        static_keys.push_back(std::move(*key));
    }

    core::KeyResolverConfig resolver_config;
    std::shared_ptr<core::JwksSource> source;
    if (config.jwks && !config.jwks->url.empty()) {
        resolver_config.cache_ttl = std::chrono::seconds(config.jwks->cache_ttl_seconds);
        resolver_config.fetch_timeout = std::chrono::milliseconds(config.jwks->fetch_timeout_ms);
        source = std::make_shared<core::HttpJwksSource>(config.jwks->url,
                                                        resolver_config.fetch_timeout);
    }

    return std::make_shared<core::KeyResolver>(resolver_config, std::move(source),
                                               std::move(static_keys));
}

std::shared_ptr<AuditSink> build_audit_sink(const control::AuditConfig& config) {
    return std::make_shared<QuillAuditSink>(config.sink, config.path);
}

Gateway::Config build_gateway_config(const control::Config& config) {
    Gateway::Config gateway_config;
    gateway_config.auth.header = config.identity.header;
    gateway_config.auth.scheme = config.identity.scheme;

    const auto& fwd = config.forwarding;
    gateway_config.forwarding.strip_authorization = fwd.strip_authorization;
    gateway_config.forwarding.user_header = fwd.user_header;
    gateway_config.forwarding.roles_header = fwd.roles_header;
    gateway_config.forwarding.claims_header = fwd.claims_header;
    gateway_config.forwarding.claims_as_json = fwd.claims_encoding == "json";

    return gateway_config;
}

std::unique_ptr<Gateway> build_gateway(const control::Config& config,
                                       std::shared_ptr<core::KeyResolver> keys,
                                       std::shared_ptr<BackendClient> backend_client,
                                       std::shared_ptr<AuditSink> audit_sink) {
    // Fatal at startup: an empty or invalid policy never serves traffic
    auto policy = std::make_shared<PolicyEngine>(build_rules(config.policy));
    auto router = std::make_shared<Router>(build_routes(config.routes));

    if (!audit_sink) {
        audit_sink = build_audit_sink(config.audit);
    }

    GatewayComponents components;
    components.verifier =
        std::make_shared<core::TokenVerifier>(build_verifier_config(config.identity), std::move(keys));
    components.policy = std::move(policy);
    components.router = std::move(router);
    components.backend_client = std::move(backend_client);
    components.audit = std::make_shared<AuditLogger>(std::move(audit_sink));
    components.backends = build_backends(config.backends);

    auto* logger = logging::get_current_logger();
    if (logger) {
        LOG_INFO(logger, "Gateway assembled: rules={}, routes={}, backends={}",
                 components.policy->size(), components.router->size(),
                 components.backends.size());
    }

    return std::make_unique<Gateway>(build_gateway_config(config), std::move(components));
}

}  // namespace bastion::gateway
