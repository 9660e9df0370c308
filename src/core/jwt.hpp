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

// Bastion JWT Verification - Header
// RFC 7515/7519 bearer token verification with a pinned asymmetric algorithm list

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

#include "containers.hpp"

namespace bastion::core {

// Forward declaration
class KeyResolver;

// Security limits (DoS prevention)
constexpr size_t MAX_TOKEN_LENGTH = 16 * 1024;  // Compact JWS larger than this is malformed
constexpr size_t MAX_CLAIM_ROLES = 256;         // Roles accepted from a single token

/// Signature algorithms the verifier understands.
/// Symmetric (HS*) and "none" are deliberately not representable.
enum class JwtAlgorithm {
    RS256,  // RSASSA-PKCS1-v1_5 + SHA-256
    RS384,  // RSASSA-PKCS1-v1_5 + SHA-384
    RS512,  // RSASSA-PKCS1-v1_5 + SHA-512
    ES256   // ECDSA P-256 + SHA-256
};

/// Why a token was rejected
enum class VerificationError {
    Missing,               // No bearer token presented
    Malformed,             // Not a well-formed compact JWS or claims set
    UnsupportedAlgorithm,  // alg outside the pinned allow-list (incl. none, HS*)
    SignatureInvalid,      // Signature does not verify under the selected key
    Expired,               // now >= exp
    NotYetValid,           // now < nbf
    IssuerMismatch,        // iss differs from the configured issuer
    AudienceMismatch,      // aud does not name a configured audience
    KeyUnavailable         // No key for kid (unknown, or JWKS fetch failed)
};

/// JWT header (decoded from first segment)
struct JwtHeader {
    std::string alg;     // Raw algorithm name, checked against the allow-list
    std::string type;    // Usually "JWT"
    std::string key_id;  // kid, the only key selector

    [[nodiscard]] static std::optional<JwtHeader> parse(std::string_view json);
};

/// Public key used to verify signatures (RAII over OpenSSL EVP_PKEY)
struct SigningKey {
    std::string key_id;
    std::optional<JwtAlgorithm> algorithm;  // Pinned by the key source ("alg"), if any
    EVP_PKEY* public_key = nullptr;
    std::chrono::system_clock::time_point fetched_at{};

    ~SigningKey();

    // Non-copyable (owns OpenSSL resources)
    SigningKey(const SigningKey&) = delete;
    SigningKey& operator=(const SigningKey&) = delete;
    SigningKey(SigningKey&&) noexcept;
    SigningKey& operator=(SigningKey&&) noexcept;

    SigningKey() = default;

    /// Whether this key may verify a token signed with alg.
    /// Key type must fit the algorithm family; a pinned algorithm must match exactly.
    [[nodiscard]] bool accepts(JwtAlgorithm alg) const noexcept;

    /// Verify signature over message (raw JWS signature bytes)
    [[nodiscard]] bool verify(JwtAlgorithm alg, std::string_view message,
                              std::string_view signature) const;

    /// Load RSA/ECDSA public key from PEM file
    [[nodiscard]] static std::optional<SigningKey> load_public_key(
        std::optional<JwtAlgorithm> alg, std::string_view key_id, std::string_view pem_path);

    /// Load RSA/ECDSA public key from PEM text
    [[nodiscard]] static std::optional<SigningKey> from_pem(std::optional<JwtAlgorithm> alg,
                                                            std::string_view key_id,
                                                            std::string_view pem);
};

/// Verified identity of a request.
/// Immutable; only TokenVerifier can build one, and only after the signature checks out.
class Claims {
public:
    [[nodiscard]] const std::string& issuer() const noexcept { return issuer_; }
    [[nodiscard]] const std::string& subject() const noexcept { return subject_; }
    [[nodiscard]] const std::vector<std::string>& audience() const noexcept { return audience_; }

    [[nodiscard]] int64_t expires_at() const noexcept { return expires_at_; }
    [[nodiscard]] std::optional<int64_t> not_before() const noexcept { return not_before_; }
    [[nodiscard]] std::optional<int64_t> issued_at() const noexcept { return issued_at_; }

    /// Username from the configured claim (preferred_username by default)
    [[nodiscard]] const std::optional<std::string>& username() const noexcept {
        return username_;
    }

    /// Roles in token order, without duplicates
    [[nodiscard]] const fast_set<std::string>& roles() const noexcept { return roles_; }
    [[nodiscard]] bool has_role(std::string_view role) const;

    /// Verified payload JSON, as sent by the identity provider
    [[nodiscard]] const std::string& raw_payload() const noexcept { return raw_payload_; }

private:
    friend class TokenVerifier;
    Claims() = default;

    std::string issuer_;
    std::string subject_;
    std::vector<std::string> audience_;
    int64_t expires_at_ = 0;
    std::optional<int64_t> not_before_;
    std::optional<int64_t> issued_at_;
    std::optional<std::string> username_;
    fast_set<std::string> roles_;
    std::string raw_payload_;
};

/// JWT verification result
struct VerifyResult {
    bool valid = false;
    std::optional<Claims> claims;
    VerificationError error = VerificationError::Malformed;

    [[nodiscard]] static VerifyResult success(Claims claims) {
        return {true, std::move(claims), VerificationError::Malformed};
    }

    [[nodiscard]] static VerifyResult failure(VerificationError error) {
        return {false, std::nullopt, error};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// Token verifier configuration
struct VerifierConfig {
    std::string issuer;                                      // Exact expected iss
    std::vector<JwtAlgorithm> algorithms{JwtAlgorithm::RS256};  // Pinned allow-list
    std::vector<std::string> audiences;                      // Empty = aud not checked
    int64_t clock_skew_seconds = 0;

    std::string username_claim = "preferred_username";
    std::string roles_claim = "realm_access.roles";  // Dotted path into the payload
    bool username_fallback_to_subject = false;
};

/// Token verifier (stateless apart from the shared key resolver)
class TokenVerifier {
public:
    TokenVerifier(VerifierConfig config, std::shared_ptr<KeyResolver> keys);
    ~TokenVerifier() = default;

    // Non-copyable, movable
    TokenVerifier(const TokenVerifier&) = delete;
    TokenVerifier& operator=(const TokenVerifier&) = delete;
    TokenVerifier(TokenVerifier&&) noexcept = default;
    TokenVerifier& operator=(TokenVerifier&&) noexcept = default;

    /// Verify against the configured issuer at the current time
    [[nodiscard]] VerifyResult verify(std::string_view token) const;

    /// Verify against an explicit issuer and clock (Unix seconds)
    [[nodiscard]] VerifyResult verify(std::string_view token, std::string_view expected_issuer,
                                      std::time_t now) const;

    [[nodiscard]] const VerifierConfig& config() const noexcept { return config_; }

private:
    /// Validate claims (iss, exp, nbf, aud) and build the claims context
    [[nodiscard]] VerifyResult check_claims(std::string payload_json,
                                            std::string_view expected_issuer,
                                            std::time_t now) const;

    [[nodiscard]] bool algorithm_allowed(JwtAlgorithm alg) const noexcept;

    VerifierConfig config_;
    std::shared_ptr<KeyResolver> keys_;
};

// Utility functions

/// Base64url encode without padding (RFC 4648 section 5)
[[nodiscard]] std::string base64url_encode(std::string_view input);

/// Base64url decode; rejects characters outside the alphabet
[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view input);

/// Standard base64 encode with padding (RFC 4648 section 4)
[[nodiscard]] std::string base64_encode(std::string_view input);

/// Parse algorithm string to enum (nullopt for anything outside the supported set)
[[nodiscard]] std::optional<JwtAlgorithm> parse_algorithm(std::string_view alg_str);

/// Convert algorithm enum to string
[[nodiscard]] std::string_view algorithm_to_string(JwtAlgorithm alg);

/// Stable snake_case name of a verification error (used in audit records and logs)
[[nodiscard]] std::string_view to_string(VerificationError error) noexcept;

}  // namespace bastion::core
