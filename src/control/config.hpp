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

// Bastion Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bastion::control {

/// Inbound listener
struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8080;
    uint32_t worker_threads = 0;  // 0 = auto-detect CPU count

    // Timeouts (milliseconds)
    uint32_t read_timeout = 30000;
    uint32_t write_timeout = 30000;

    // Limits
    uint32_t max_request_size = 1048576;  // 1MB
};

/// Pinned public key from a PEM file (never expires)
struct StaticKeyConfig {
    std::string key_id;
    std::string algorithm;  // Optional: pins the key to one algorithm
    std::string public_key_path;
};

/// JWKS endpoint of the identity provider
struct JwksConfigSchema {
    std::string url;
    uint32_t cache_ttl_seconds = 300;
    uint32_t fetch_timeout_ms = 5000;
    bool prefetch = true;  // Warm the cache once at startup
};

/// Token verification settings
struct IdentityConfig {
    std::string issuer;  // Required, compared exactly
    std::vector<std::string> audiences;
    std::vector<std::string> algorithms = {"RS256"};
    int64_t clock_skew_seconds = 0;

    // Claim mapping (Keycloak layout by default)
    std::string username_claim = "preferred_username";
    std::string roles_claim = "realm_access.roles";
    bool username_fallback_to_subject = false;

    // Where the token travels
    std::string header = "Authorization";
    std::string scheme = "Bearer";

    std::optional<JwksConfigSchema> jwks;
    std::vector<StaticKeyConfig> keys;
};

/// Who a rule applies to
struct PrincipalConfig {
    std::string type = "authenticated";  // authenticated | username | role
    std::string value;                   // Username or role literal
};

/// One access rule
struct RuleConfig {
    std::string id;
    std::string effect = "allow";  // allow | deny
    std::string path;
    std::string match = "prefix";  // prefix | exact
    std::vector<std::string> methods;  // Empty = any method
    PrincipalConfig principal;
};

/// Ordered rule list: first match wins, no match denies
struct PolicyConfig {
    std::vector<RuleConfig> rules;
};

/// Path prefix -> backend mapping
struct RouteConfig {
    std::string prefix;
    std::string backend;
    std::string rewrite = "/";
};

/// Backend service
struct BackendConfig {
    std::string name;
    std::string host;
    uint16_t port = 0;
    uint32_t connect_timeout_ms = 2000;
    uint32_t read_timeout_ms = 30000;
    uint32_t max_retries = 1;  // Extra attempts, idempotent methods only
};

/// Identity headers added to forwarded requests
struct ForwardingConfig {
    bool strip_authorization = true;
    std::string user_header = "X-Forwarded-User";
    std::string roles_header = "X-Forwarded-Roles";
    std::string claims_header = "X-Jwt-Payload";  // Empty = not forwarded
    std::string claims_encoding = "base64";       // base64 | json
};

/// Access record destination
struct AuditConfig {
    std::string sink = "stdout";  // stdout | file
    std::string path;             // Required for file
};

/// Operational logging
struct LogConfig {
    std::string level = "info";
    std::string format = "json";               // json | text
    std::string output = "/var/log/bastion";  // Directory, or "-" for the console

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Root configuration
struct Config {
    ServerConfig server;
    IdentityConfig identity;
    PolicyConfig policy;
    std::vector<RouteConfig> routes;
    std::vector<BackendConfig> backends;
    ForwardingConfig forwarding;
    AuditConfig audit;
    LogConfig logging;

    std::string version = "1.0";
    std::string description;
};

// All config types use custom from_json/to_json (no macros)
// Optional fields fall back to the defaults above

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", uint16_t(8080));
    s.worker_threads = j.value("worker_threads", 0u);
    s.read_timeout = j.value("read_timeout_ms", 30000u);
    s.write_timeout = j.value("write_timeout_ms", 30000u);
    s.max_request_size = j.value("max_request_size", 1048576u);
}

inline void from_json(const nlohmann::json& j, StaticKeyConfig& k) {
    j.at("public_key_path").get_to(k.public_key_path);  // path is required
    k.key_id = j.value("key_id", std::string());
    k.algorithm = j.value("algorithm", std::string());
}

inline void from_json(const nlohmann::json& j, JwksConfigSchema& jwks) {
    j.at("url").get_to(jwks.url);  // url is required
    jwks.cache_ttl_seconds = j.value("cache_ttl_seconds", 300u);
    jwks.fetch_timeout_ms = j.value("fetch_timeout_ms", 5000u);
    jwks.prefetch = j.value("prefetch", true);
}

inline void from_json(const nlohmann::json& j, IdentityConfig& id) {
    j.at("issuer").get_to(id.issuer);  // issuer is required
    id.audiences = j.value("audiences", std::vector<std::string>());
    id.algorithms = j.value("algorithms", std::vector<std::string>{"RS256"});
    id.clock_skew_seconds = j.value("clock_skew_seconds", int64_t(0));
    id.username_claim = j.value("username_claim", std::string("preferred_username"));
    id.roles_claim = j.value("roles_claim", std::string("realm_access.roles"));
    id.username_fallback_to_subject = j.value("username_fallback_to_subject", false);
    id.header = j.value("header", std::string("Authorization"));
    id.scheme = j.value("scheme", std::string("Bearer"));

    // Use contains() for custom struct types to avoid infinite recursion
    if (j.contains("jwks")) {
        id.jwks = j.at("jwks").get<JwksConfigSchema>();
    }
    if (j.contains("keys")) {
        j.at("keys").get_to(id.keys);
    }
}

inline void from_json(const nlohmann::json& j, PrincipalConfig& p) {
    p.type = j.value("type", std::string("authenticated"));
    p.value = j.value("value", std::string());
}

inline void from_json(const nlohmann::json& j, RuleConfig& r) {
    j.at("id").get_to(r.id);
    j.at("path").get_to(r.path);
    r.effect = j.value("effect", std::string("allow"));
    r.match = j.value("match", std::string("prefix"));
    r.methods = j.value("methods", std::vector<std::string>());
    if (j.contains("principal")) {
        j.at("principal").get_to(r.principal);
    }
}

inline void from_json(const nlohmann::json& j, PolicyConfig& p) {
    if (j.contains("rules")) {
        j.at("rules").get_to(p.rules);
    }
}

inline void from_json(const nlohmann::json& j, RouteConfig& r) {
    j.at("prefix").get_to(r.prefix);
    j.at("backend").get_to(r.backend);
    r.rewrite = j.value("rewrite", std::string("/"));
}

inline void from_json(const nlohmann::json& j, BackendConfig& b) {
    j.at("name").get_to(b.name);
    b.host = j.value("host", std::string());
    b.port = j.value("port", uint16_t(0));
    b.connect_timeout_ms = j.value("connect_timeout_ms", 2000u);
    b.read_timeout_ms = j.value("read_timeout_ms", 30000u);
    b.max_retries = j.value("max_retries", 1u);
}

inline void from_json(const nlohmann::json& j, ForwardingConfig& f) {
    f.strip_authorization = j.value("strip_authorization", true);
    f.user_header = j.value("user_header", std::string("X-Forwarded-User"));
    f.roles_header = j.value("roles_header", std::string("X-Forwarded-Roles"));
    f.claims_header = j.value("claims_header", std::string("X-Jwt-Payload"));
    f.claims_encoding = j.value("claims_encoding", std::string("base64"));
}

inline void from_json(const nlohmann::json& j, AuditConfig& a) {
    a.sink = j.value("sink", std::string("stdout"));
    a.path = j.value("path", std::string());
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/bastion"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get() instead of value() to avoid infinite recursion
    // when default values trigger to_json() -> from_json() cycles
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    j.at("identity").get_to(c.identity);  // identity is required
    if (j.contains("policy")) {
        j.at("policy").get_to(c.policy);
    }
    if (j.contains("routes")) {
        j.at("routes").get_to(c.routes);
    }
    if (j.contains("backends")) {
        j.at("backends").get_to(c.backends);
    }
    if (j.contains("forwarding")) {
        j.at("forwarding").get_to(c.forwarding);
    }
    if (j.contains("audit")) {
        j.at("audit").get_to(c.audit);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    c.version = j.value("version", std::string("1.0"));
    c.description = j.value("description", std::string());
}

// to_json functions for all config types

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"worker_threads", s.worker_threads},
                       {"read_timeout_ms", s.read_timeout},
                       {"write_timeout_ms", s.write_timeout},
                       {"max_request_size", s.max_request_size}};
}

inline void to_json(nlohmann::json& j, const StaticKeyConfig& k) {
    j = nlohmann::json{
        {"key_id", k.key_id}, {"algorithm", k.algorithm}, {"public_key_path", k.public_key_path}};
}

inline void to_json(nlohmann::json& j, const JwksConfigSchema& jwks) {
    j = nlohmann::json{{"url", jwks.url},
                       {"cache_ttl_seconds", jwks.cache_ttl_seconds},
                       {"fetch_timeout_ms", jwks.fetch_timeout_ms},
                       {"prefetch", jwks.prefetch}};
}

inline void to_json(nlohmann::json& j, const IdentityConfig& id) {
    j = nlohmann::json{{"issuer", id.issuer},
                       {"audiences", id.audiences},
                       {"algorithms", id.algorithms},
                       {"clock_skew_seconds", id.clock_skew_seconds},
                       {"username_claim", id.username_claim},
                       {"roles_claim", id.roles_claim},
                       {"username_fallback_to_subject", id.username_fallback_to_subject},
                       {"header", id.header},
                       {"scheme", id.scheme},
                       {"keys", id.keys}};
    if (id.jwks) {
        j["jwks"] = *id.jwks;
    }
}

inline void to_json(nlohmann::json& j, const PrincipalConfig& p) {
    j = nlohmann::json{{"type", p.type}};
    if (!p.value.empty()) {
        j["value"] = p.value;
    }
}

inline void to_json(nlohmann::json& j, const RuleConfig& r) {
    j = nlohmann::json{{"id", r.id},         {"effect", r.effect},   {"path", r.path},
                       {"match", r.match},   {"methods", r.methods}, {"principal", r.principal}};
}

inline void to_json(nlohmann::json& j, const PolicyConfig& p) {
    j = nlohmann::json{{"rules", p.rules}};
}

inline void to_json(nlohmann::json& j, const RouteConfig& r) {
    j = nlohmann::json{{"prefix", r.prefix}, {"backend", r.backend}, {"rewrite", r.rewrite}};
}

inline void to_json(nlohmann::json& j, const BackendConfig& b) {
    j = nlohmann::json{{"name", b.name},
                       {"host", b.host},
                       {"port", b.port},
                       {"connect_timeout_ms", b.connect_timeout_ms},
                       {"read_timeout_ms", b.read_timeout_ms},
                       {"max_retries", b.max_retries}};
}

inline void to_json(nlohmann::json& j, const ForwardingConfig& f) {
    j = nlohmann::json{{"strip_authorization", f.strip_authorization},
                       {"user_header", f.user_header},
                       {"roles_header", f.roles_header},
                       {"claims_header", f.claims_header},
                       {"claims_encoding", f.claims_encoding}};
}

inline void to_json(nlohmann::json& j, const AuditConfig& a) {
    j = nlohmann::json{{"sink", a.sink}, {"path", a.path}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json::object();
    j["server"] = c.server;
    j["identity"] = c.identity;
    j["policy"] = c.policy;
    j["routes"] = c.routes;
    j["backends"] = c.backends;
    j["forwarding"] = c.forwarding;
    j["audit"] = c.audit;
    j["logging"] = c.logging;
    j["version"] = c.version;
    j["description"] = c.description;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load and validate configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path,
                                                              ValidationResult& result);

    /// Load and validate configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json,
                                                              ValidationResult& result);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Validate just the policy section (also used on reload)
    static void validate_policy(const PolicyConfig& policy, ValidationResult& result);

    /// Validate routes against the configured backends
    static void validate_routes(const std::vector<RouteConfig>& routes,
                                const std::vector<BackendConfig>& backends,
                                ValidationResult& result);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Configuration manager with hot-reload support (RCU pattern)
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration
    [[nodiscard]] bool load(std::string_view path);

    /// Reload configuration (hot-reload with RCU)
    [[nodiscard]] bool reload();

    /// Get current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    /// Get configuration file path
    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    /// Check if configuration is loaded
    [[nodiscard]] bool is_loaded() const noexcept { return get() != nullptr; }

    /// Get last validation result
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace bastion::control
