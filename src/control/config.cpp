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

// Bastion Configuration - Implementation

#include "config.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "../core/containers.hpp"
#include "../core/jwt.hpp"  // For algorithm names
#include "../core/string_utils.hpp"
#include "../http/http.hpp"

namespace bastion::control {

namespace {

const std::vector<std::string> kPrincipalTypes = {"authenticated", "username", "role"};
const std::vector<std::string> kLogLevels = {"trace", "debug", "info", "warning", "error"};

// Append a "did you mean" hint when a close candidate exists
std::string with_suggestion(std::string message, std::string_view value,
                            const std::vector<std::string>& candidates) {
    auto suggestion = core::closest_match(value, candidates);
    if (!suggestion.empty()) {
        message += " (did you mean '" + suggestion + "'?)";
    }
    return message;
}

bool methods_cover(const RuleConfig& broad, const RuleConfig& narrow) {
    if (broad.methods.empty()) {
        return true;
    }
    if (narrow.methods.empty()) {
        return false;
    }
    for (const auto& method : narrow.methods) {
        bool found = false;
        for (const auto& candidate : broad.methods) {
            if (core::iequals(candidate, method)) {
                found = true;
                break;
            }
        }
        if (!found) {
            return false;
        }
    }
    return true;
}

bool principal_covers(const PrincipalConfig& broad, const PrincipalConfig& narrow) {
    if (broad.type == "authenticated") {
        return true;
    }
    return broad.type == narrow.type && broad.value == narrow.value;
}

bool same_path_predicate(const RuleConfig& a, const RuleConfig& b) {
    return a.match == b.match && core::normalize_prefix(a.path) == core::normalize_prefix(b.path);
}

void validate_rule(const RuleConfig& rule, ValidationResult& result) {
    std::string context = "Rule '" + rule.id + "'";

    if (rule.id.empty()) {
        result.add_error("Rule id cannot be empty (path '" + rule.path + "')");
    }

    if (rule.effect != "allow" && rule.effect != "deny") {
        result.add_error(with_suggestion(context + " has unknown effect '" + rule.effect + "'",
                                         rule.effect, {"allow", "deny"}));
    }

    if (rule.match != "prefix" && rule.match != "exact") {
        result.add_error(with_suggestion(context + " has unknown match '" + rule.match + "'",
                                         rule.match, {"prefix", "exact"}));
    }

    if (rule.path.empty() || rule.path.front() != '/') {
        result.add_error(context + " path must start with '/'");
    }

    for (const auto& method : rule.methods) {
        if (http::parse_method(method) == http::Method::UNKNOWN) {
            result.add_error(context + " has unknown HTTP method '" + method + "'");
        }
    }

    const auto& principal = rule.principal;
    if (principal.type == "username" || principal.type == "role") {
        if (principal.value.empty()) {
            result.add_error(context + " " + principal.type + " principal has an empty value");
        }
    } else if (principal.type != "authenticated") {
        result.add_error(with_suggestion(
            context + " has unknown principal type '" + principal.type + "'", principal.type,
            kPrincipalTypes));
    }
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path, ValidationResult& result) {
    // Read file contents
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        result.add_error("Cannot open configuration file '" + path_str + "'");
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json, result);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json, ValidationResult& result) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        result.add_error(std::string("JSON parsing error: ") + e.what());
        return std::nullopt;
    }

    // Validate configuration
    result = validate(config);
    if (result.has_errors()) {
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Validate server configuration
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    }

    if (config.server.max_request_size == 0) {
        result.add_error("Server max_request_size must be > 0");
    }

    // Validate identity
    const auto& identity = config.identity;
    if (identity.issuer.empty()) {
        result.add_error("Identity issuer is required");
    }

    bool has_jwks = identity.jwks.has_value() && !identity.jwks->url.empty();
    if (!has_jwks && identity.keys.empty()) {
        result.add_error("Identity needs a jwks url or at least one static key");
    }

    if (has_jwks) {
        const auto& url = identity.jwks->url;
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
            result.add_error("JWKS url must start with http:// or https:// ('" + url + "')");
        }
        if (identity.jwks->fetch_timeout_ms == 0) {
            result.add_error("JWKS fetch_timeout_ms must be > 0");
        }
        if (identity.jwks->cache_ttl_seconds == 0) {
            result.add_warning("JWKS cache_ttl_seconds is 0 (every request refetches keys)");
        }
    }

    std::vector<std::string> algorithm_names = {"RS256", "RS384", "RS512", "ES256"};
    if (identity.algorithms.empty()) {
        result.add_error("Identity algorithms cannot be empty");
    }
    for (const auto& alg : identity.algorithms) {
        if (!core::parse_algorithm(alg).has_value()) {
            // none and HS* are rejected here as well
            result.add_error(with_suggestion("Identity algorithm '" + alg + "' is not allowed",
                                             alg, algorithm_names));
        }
    }

    if (identity.clock_skew_seconds < 0) {
        result.add_error("Identity clock_skew_seconds cannot be negative");
    }

    if (identity.header.empty()) {
        result.add_error("Identity header cannot be empty");
    }

    core::string_set key_ids;
    for (const auto& key : identity.keys) {
        if (key.public_key_path.empty()) {
            result.add_error("Static key '" + key.key_id + "' has no public_key_path");
        }
        if (!key.algorithm.empty() && !core::parse_algorithm(key.algorithm).has_value()) {
            result.add_error("Static key '" + key.key_id + "' has unknown algorithm '" +
                             key.algorithm + "'");
        }
        if (!key_ids.insert(key.key_id).second) {
            result.add_error("Duplicate static key id '" + key.key_id + "'");
        }
    }
    if (identity.keys.size() > 1) {
        for (const auto& key : identity.keys) {
            if (key.key_id.empty()) {
                result.add_error("Static key without key_id requires a single static key");
                break;
            }
        }
    }

    validate_policy(config.policy, result);

    // Validate backends
    core::string_set backend_names;
    for (const auto& backend : config.backends) {
        if (backend.name.empty()) {
            result.add_error("Backend name cannot be empty");
        }
        if (!backend_names.insert(backend.name).second) {
            result.add_error("Duplicate backend name '" + backend.name + "'");
        }
        if (backend.host.empty()) {
            result.add_error("Backend '" + backend.name + "' has no host");
        }
        if (backend.port == 0) {
            result.add_error("Backend '" + backend.name + "' port must be > 0");
        }
        if (backend.read_timeout_ms == 0 || backend.connect_timeout_ms == 0) {
            result.add_error("Backend '" + backend.name + "' timeouts must be > 0");
        }
    }

    validate_routes(config.routes, config.backends, result);

    // Validate forwarding
    if (config.forwarding.claims_encoding != "base64" &&
        config.forwarding.claims_encoding != "json") {
        result.add_error(with_suggestion(
            "Unknown forwarding claims_encoding '" + config.forwarding.claims_encoding + "'",
            config.forwarding.claims_encoding, {"base64", "json"}));
    }
    if (config.forwarding.user_header.empty() || config.forwarding.roles_header.empty()) {
        result.add_error("Forwarding user_header and roles_header cannot be empty");
    }

    // Validate audit sink
    if (config.audit.sink == "file") {
        if (config.audit.path.empty()) {
            result.add_error("Audit file sink requires a path");
        }
    } else if (config.audit.sink != "stdout") {
        result.add_error(with_suggestion("Unknown audit sink '" + config.audit.sink + "'",
                                         config.audit.sink, {"stdout", "file"}));
    }

    // Validate logging level
    if (std::find(kLogLevels.begin(), kLogLevels.end(), config.logging.level) ==
        kLogLevels.end()) {
        result.add_error(with_suggestion("Unknown logging level '" + config.logging.level + "'",
                                         config.logging.level, kLogLevels));
    }

    // Validate logging format
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error(with_suggestion("Unknown logging format '" + config.logging.format + "'",
                                         config.logging.format, {"json", "text"}));
    }

    return result;
}

void ConfigLoader::validate_policy(const PolicyConfig& policy, ValidationResult& result) {
    if (policy.rules.empty()) {
        result.add_error("Policy has no rules (every request would be denied)");
        return;
    }

    core::string_set rule_ids;
    for (const auto& rule : policy.rules) {
        validate_rule(rule, result);
        if (!rule.id.empty() && !rule_ids.insert(rule.id).second) {
            result.add_error("Duplicate rule id '" + rule.id + "'");
        }
    }

    // Shadowing and mixed principal kinds (warnings only)
    for (size_t j = 0; j < policy.rules.size(); ++j) {
        const auto& later = policy.rules[j];
        for (size_t i = 0; i < j; ++i) {
            const auto& earlier = policy.rules[i];
            if (!same_path_predicate(earlier, later)) {
                continue;
            }
            if (methods_cover(earlier, later) &&
                principal_covers(earlier.principal, later.principal)) {
                result.add_warning("Rule '" + later.id + "' is unreachable: shadowed by '" +
                                   earlier.id + "'");
                break;
            }
        }
    }

    for (size_t j = 0; j < policy.rules.size(); ++j) {
        const auto& later = policy.rules[j];
        for (size_t i = 0; i < j; ++i) {
            const auto& earlier = policy.rules[i];
            bool mixed = (earlier.principal.type == "role" && later.principal.type == "username") ||
                         (earlier.principal.type == "username" && later.principal.type == "role");
            if (mixed && same_path_predicate(earlier, later)) {
                result.add_warning("Rules '" + earlier.id + "' and '" + later.id +
                                   "' mix role and username principals on path '" +
                                   later.path + "' (first match wins)");
            }
        }
    }
}

void ConfigLoader::validate_routes(const std::vector<RouteConfig>& routes,
                                   const std::vector<BackendConfig>& backends,
                                   ValidationResult& result) {
    if (routes.empty()) {
        result.add_warning("No routes configured (every request returns 404)");
    }

    std::vector<std::string> backend_names;
    backend_names.reserve(backends.size());
    for (const auto& backend : backends) {
        backend_names.push_back(backend.name);
    }

    core::string_set prefixes;
    for (const auto& route : routes) {
        if (route.prefix.empty() || route.prefix.front() != '/') {
            result.add_error("Route prefix '" + route.prefix + "' must start with '/'");
        }
        if (route.rewrite.empty() || route.rewrite.front() != '/') {
            result.add_error("Route '" + route.prefix + "' rewrite must start with '/'");
        }
        if (!prefixes.insert(core::normalize_prefix(route.prefix)).second) {
            result.add_error("Duplicate route prefix '" + route.prefix + "'");
        }
        if (std::find(backend_names.begin(), backend_names.end(), route.backend) ==
            backend_names.end()) {
            result.add_error(with_suggestion("Route '" + route.prefix +
                                                 "' references non-existent backend '" +
                                                 route.backend + "'",
                                             route.backend, backend_names));
        }
    }
}

std::string ConfigLoader::to_json(const Config& config) {
    nlohmann::json j = config;
    return j.dump(2);
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;

    ValidationResult validation;
    auto maybe_config = ConfigLoader::load_from_file(path, validation);
    last_validation_ = std::move(validation);
    if (!maybe_config.has_value()) {
        return false;
    }

    // Store configuration (atomic swap)
    std::atomic_store(&current_config_,
                      std::shared_ptr<const Config>(
                          std::make_shared<const Config>(std::move(*maybe_config))));

    return true;
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }

    ValidationResult validation;
    auto maybe_config = ConfigLoader::load_from_file(config_path_, validation);
    last_validation_ = std::move(validation);
    if (!maybe_config.has_value()) {
        return false;
    }

    // RCU pattern: Create new shared_ptr and atomically swap
    // Old config remains valid until all readers release their references
    auto new_config = std::make_shared<const Config>(std::move(*maybe_config));
    std::atomic_store(&current_config_, std::shared_ptr<const Config>(std::move(new_config)));

    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    // Atomic load - safe for concurrent readers
    return std::atomic_load(&current_config_);
}

}  // namespace bastion::control
