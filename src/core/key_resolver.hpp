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

// Bastion Key Resolver - Header
// kid -> public key lookup backed by a JWKS endpoint (Keycloak, Auth0, ...)
// with a TTL cache and one in-flight fetch per key id

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "jwt.hpp"

namespace bastion::core {

/// JWK (JSON Web Key) parsed from a JWKS document
struct JsonWebKey {
    std::string kty;  // Key type: "RSA" or "EC"
    std::string alg;  // Algorithm: "RS256", "ES256", ... (optional)
    std::string kid;  // Key ID
    std::string use;  // Key use: "sig" for signature

    // RSA-specific fields
    std::string n;  // Modulus (base64url)
    std::string e;  // Exponent (base64url)

    // EC-specific fields
    std::string crv;  // Curve: "P-256" for ES256
    std::string x;    // X coordinate (base64url)
    std::string y;    // Y coordinate (base64url)

    [[nodiscard]] static std::optional<JsonWebKey> parse(const nlohmann::json& j);
};

/// Parse a JWKS document ({"keys": [...]}); entries that are not objects are skipped
[[nodiscard]] std::optional<std::vector<JsonWebKey>> parse_jwks(std::string_view json);

/// Convert a signature JWK to a verification key (nullopt for unusable keys)
[[nodiscard]] std::optional<SigningKey> jwk_to_signing_key(const JsonWebKey& jwk);

/// Where JWKS documents come from
class JwksSource {
public:
    virtual ~JwksSource() = default;

    /// Fetch the raw JWKS document (nullopt on any transport or status error)
    [[nodiscard]] virtual std::optional<std::string> fetch() = 0;

    /// Human readable origin for logs
    [[nodiscard]] virtual std::string describe() const = 0;
};

/// JWKS over HTTP(S) GET
class HttpJwksSource : public JwksSource {
public:
    HttpJwksSource(std::string url, std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<std::string> fetch() override;
    [[nodiscard]] std::string describe() const override { return url_; }

private:
    std::string url_;
    std::string base_url_;  // scheme://host[:port]
    std::string path_;
    std::chrono::milliseconds timeout_;
};

/// Key resolver configuration
struct KeyResolverConfig {
    std::chrono::milliseconds cache_ttl{std::chrono::seconds(300)};
    std::chrono::milliseconds fetch_timeout{5000};  // Max wait for an in-flight fetch
};

/// Key resolver.
/// Readers see an immutable key snapshot through one atomic load. A miss (or an
/// expired entry) joins the in-flight fetch for that kid or starts one; every
/// waiter gets the same outcome or gives up after fetch_timeout.
class KeyResolver {
public:
    KeyResolver(KeyResolverConfig config, std::shared_ptr<JwksSource> source,
                std::vector<SigningKey> static_keys = {});
    ~KeyResolver() = default;

    // Non-copyable, non-movable (fetch threads share its state)
    KeyResolver(const KeyResolver&) = delete;
    KeyResolver& operator=(const KeyResolver&) = delete;
    KeyResolver(KeyResolver&&) = delete;
    KeyResolver& operator=(KeyResolver&&) = delete;

    /// Resolve kid to a key; null when unknown or the fetch failed/timed out.
    /// An empty kid resolves only when exactly one static key is configured.
    [[nodiscard]] std::shared_ptr<const SigningKey> resolve(std::string_view key_id);

    /// Fetch the JWKS once, synchronously (startup warm-up)
    [[nodiscard]] bool prefetch();

    /// Keys currently cached from the JWKS source (static keys excluded)
    [[nodiscard]] size_t cached_key_count() const;

    /// Number of JWKS fetches attempted so far
    [[nodiscard]] uint64_t fetch_count() const noexcept;

private:
    struct State;
    std::shared_ptr<State> state_;
};

}  // namespace bastion::core
