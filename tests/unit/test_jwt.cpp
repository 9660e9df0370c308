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

#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "core/jwt.hpp"
#include "core/key_resolver.hpp"
#include "test_helpers.hpp"

using namespace bastion::core;
using namespace bastion::test;

namespace {

VerifierConfig verifier_config(std::vector<JwtAlgorithm> algorithms = {JwtAlgorithm::RS256}) {
    VerifierConfig config;
    config.issuer = std::string(kIssuer);
    config.algorithms = std::move(algorithms);
    return config;
}

TokenVerifier rsa_verifier(VerifierConfig config = verifier_config()) {
    return TokenVerifier(std::move(config), static_resolver(rsa_key(), "rsa-1"));
}

// Swap one segment of a compact token
std::string replace_segment(const std::string& token, size_t index, const std::string& segment) {
    auto first = token.find('.');
    auto second = token.find('.', first + 1);
    std::string parts[3] = {token.substr(0, first), token.substr(first + 1, second - first - 1),
                            token.substr(second + 1)};
    parts[index] = segment;
    return parts[0] + "." + parts[1] + "." + parts[2];
}

}  // namespace

// ============================================================================
// Base64url Tests
// ============================================================================

TEST_CASE("Base64url encoding/decoding", "[jwt][base64url]") {
    SECTION("Encode empty string") {
        REQUIRE(base64url_encode("").empty());
    }

    SECTION("Decode empty string") {
        auto result = base64url_decode("");
        REQUIRE(result.has_value());
        REQUIRE(result->empty());
    }

    SECTION("Encode/decode simple string") {
        std::string input = "Hello, World!";
        auto encoded = base64url_encode(input);
        REQUIRE(!encoded.empty());
        REQUIRE(encoded.find('+') == std::string::npos);  // No '+' in base64url
        REQUIRE(encoded.find('/') == std::string::npos);  // No '/' in base64url
        REQUIRE(encoded.find('=') == std::string::npos);  // No padding in base64url

        auto decoded = base64url_decode(encoded);
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == input);
    }

    SECTION("Encode/decode binary data") {
        std::string input("\x00\x01\x02\xff\xfe\xfd", 6);
        auto decoded = base64url_decode(base64url_encode(input));
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == input);
    }

    SECTION("Reject characters outside the url-safe alphabet") {
        REQUIRE_FALSE(base64url_decode("SGVsbG8+").has_value());
        REQUIRE_FALSE(base64url_decode("SGVsbG8/").has_value());
        REQUIRE_FALSE(base64url_decode("SGVsbG8=").has_value());
        REQUIRE_FALSE(base64url_decode("SGV sbG8").has_value());
    }

    SECTION("Reject impossible lengths") {
        REQUIRE_FALSE(base64url_decode("SGVsb").has_value());
    }

    SECTION("Reject non-zero trailing bits") {
        // "QQ" is the only encoding of "A"; "QR" differs in discarded bits only
        REQUIRE(base64url_decode("QQ") == std::optional<std::string>("A"));
        REQUIRE_FALSE(base64url_decode("QR").has_value());

        // Two bytes leave two spare bits
        REQUIRE(base64url_decode("QUI") == std::optional<std::string>("AB"));
        REQUIRE_FALSE(base64url_decode("QUJ").has_value());
    }
}

TEST_CASE("Standard base64 encoding", "[jwt][base64]") {
    REQUIRE(base64_encode("") == "");
    REQUIRE(base64_encode("Hello") == "SGVsbG8=");
    REQUIRE(base64_encode("{\"sub\":\"a\"}") == "eyJzdWIiOiJhIn0=");
}

// ============================================================================
// Algorithm Parsing Tests
// ============================================================================

TEST_CASE("JWT algorithm parsing", "[jwt][algorithm]") {
    SECTION("Supported asymmetric algorithms") {
        REQUIRE(parse_algorithm("RS256") == JwtAlgorithm::RS256);
        REQUIRE(parse_algorithm("RS384") == JwtAlgorithm::RS384);
        REQUIRE(parse_algorithm("RS512") == JwtAlgorithm::RS512);
        REQUIRE(parse_algorithm("ES256") == JwtAlgorithm::ES256);
        REQUIRE(algorithm_to_string(JwtAlgorithm::RS256) == "RS256");
        REQUIRE(algorithm_to_string(JwtAlgorithm::ES256) == "ES256");
    }

    SECTION("none and symmetric algorithms are not representable") {
        REQUIRE_FALSE(parse_algorithm("none").has_value());
        REQUIRE_FALSE(parse_algorithm("None").has_value());
        REQUIRE_FALSE(parse_algorithm("HS256").has_value());
        REQUIRE_FALSE(parse_algorithm("HS512").has_value());
    }

    SECTION("Unknown and differently cased names") {
        REQUIRE_FALSE(parse_algorithm("INVALID").has_value());
        REQUIRE_FALSE(parse_algorithm("rs256").has_value());
        REQUIRE_FALSE(parse_algorithm("PS256").has_value());
        REQUIRE_FALSE(parse_algorithm("").has_value());
    }
}

TEST_CASE("Verification error names", "[jwt][errors]") {
    REQUIRE(to_string(VerificationError::Missing) == "missing");
    REQUIRE(to_string(VerificationError::Malformed) == "malformed");
    REQUIRE(to_string(VerificationError::UnsupportedAlgorithm) == "unsupported_algorithm");
    REQUIRE(to_string(VerificationError::SignatureInvalid) == "signature_invalid");
    REQUIRE(to_string(VerificationError::Expired) == "expired");
    REQUIRE(to_string(VerificationError::NotYetValid) == "not_yet_valid");
    REQUIRE(to_string(VerificationError::IssuerMismatch) == "issuer_mismatch");
    REQUIRE(to_string(VerificationError::AudienceMismatch) == "audience_mismatch");
    REQUIRE(to_string(VerificationError::KeyUnavailable) == "key_unavailable");
}

// ============================================================================
// JWT Header Parsing Tests
// ============================================================================

TEST_CASE("JWT header parsing", "[jwt][header]") {
    SECTION("Parse valid RS256 header") {
        auto header = JwtHeader::parse(R"({"alg":"RS256","typ":"JWT"})");
        REQUIRE(header.has_value());
        REQUIRE(header->alg == "RS256");
        REQUIRE(header->type == "JWT");
        REQUIRE(header->key_id.empty());
    }

    SECTION("Parse header with kid") {
        auto header = JwtHeader::parse(R"({"alg":"RS256","typ":"JWT","kid":"key-1"})");
        REQUIRE(header.has_value());
        REQUIRE(header->key_id == "key-1");
    }

    SECTION("Parse header without typ (should default)") {
        auto header = JwtHeader::parse(R"({"alg":"RS256"})");
        REQUIRE(header.has_value());
        REQUIRE(header->type == "JWT");
    }

    SECTION("Unsupported alg still parses; the verifier rejects it") {
        auto header = JwtHeader::parse(R"({"alg":"none"})");
        REQUIRE(header.has_value());
        REQUIRE(header->alg == "none");
    }

    SECTION("Invalid headers") {
        REQUIRE_FALSE(JwtHeader::parse(R"({"typ":"JWT"})").has_value());
        REQUIRE_FALSE(JwtHeader::parse(R"({"alg":256})").has_value());
        REQUIRE_FALSE(JwtHeader::parse(R"({"alg":"RS256","kid":7})").has_value());
        REQUIRE_FALSE(JwtHeader::parse(R"(["alg","RS256"])").has_value());
        REQUIRE_FALSE(JwtHeader::parse("not json").has_value());
    }
}

// ============================================================================
// Signing Key Tests
// ============================================================================

TEST_CASE("SigningKey PEM loading", "[jwt][key]") {
    SECTION("RSA public key") {
        auto key = SigningKey::from_pem(std::nullopt, "rsa-1", public_pem(rsa_key()));
        REQUIRE(key.has_value());
        REQUIRE(key->key_id == "rsa-1");
        REQUIRE(key->public_key != nullptr);
        REQUIRE(key->accepts(JwtAlgorithm::RS256));
        REQUIRE(key->accepts(JwtAlgorithm::RS512));
        REQUIRE_FALSE(key->accepts(JwtAlgorithm::ES256));
    }

    SECTION("EC public key") {
        auto key = SigningKey::from_pem(std::nullopt, "ec-1", public_pem(ec_key()));
        REQUIRE(key.has_value());
        REQUIRE(key->accepts(JwtAlgorithm::ES256));
        REQUIRE_FALSE(key->accepts(JwtAlgorithm::RS256));
    }

    SECTION("Pinned algorithm must match exactly") {
        auto key = SigningKey::from_pem(JwtAlgorithm::RS256, "rsa-1", public_pem(rsa_key()));
        REQUIRE(key.has_value());
        REQUIRE(key->accepts(JwtAlgorithm::RS256));
        REQUIRE_FALSE(key->accepts(JwtAlgorithm::RS384));
    }

    SECTION("Garbage is rejected") {
        REQUIRE_FALSE(SigningKey::from_pem(std::nullopt, "bad", "not a pem").has_value());
        REQUIRE_FALSE(SigningKey::from_pem(std::nullopt, "bad", "").has_value());
    }

    SECTION("Load from file") {
        const std::string path = "/tmp/bastion_test_public_key.pem";
        {
            std::ofstream out(path);
            out << public_pem(rsa_key());
        }

        auto key = SigningKey::load_public_key(JwtAlgorithm::RS256, "file-key", path);
        REQUIRE(key.has_value());
        REQUIRE(key->key_id == "file-key");
        std::remove(path.c_str());

        REQUIRE_FALSE(
            SigningKey::load_public_key(std::nullopt, "missing", "/nonexistent/key.pem").has_value());
    }

    SECTION("Moved-from key no longer owns the EVP_PKEY") {
        auto key = SigningKey::from_pem(std::nullopt, "rsa-1", public_pem(rsa_key()));
        REQUIRE(key.has_value());
        SigningKey moved = std::move(*key);
        REQUIRE(moved.public_key != nullptr);
        REQUIRE(key->public_key == nullptr);
    }
}

TEST_CASE("SigningKey signature verification", "[jwt][key][signature]") {
    const std::string message = "header.payload";

    SECTION("RS256") {
        auto key = static_key(rsa_key(), "rsa-1");
        auto signature = sign(rsa_key(), "RS256", message);
        REQUIRE(key.verify(JwtAlgorithm::RS256, message, signature));
        REQUIRE_FALSE(key.verify(JwtAlgorithm::RS256, "header.tampered", signature));
    }

    SECTION("ES256 takes the fixed width r||s form") {
        auto key = static_key(ec_key(), "ec-1");
        auto signature = sign(ec_key(), "ES256", message);
        REQUIRE(signature.size() == 64);
        REQUIRE(key.verify(JwtAlgorithm::ES256, message, signature));

        // DER-encoded signatures are not valid JWS signatures
        REQUIRE_FALSE(key.verify(JwtAlgorithm::ES256, message, signature.substr(0, 63)));
    }

    SECTION("Wrong key") {
        auto key = static_key(other_rsa_key(), "rsa-2");
        auto signature = sign(rsa_key(), "RS256", message);
        REQUIRE_FALSE(key.verify(JwtAlgorithm::RS256, message, signature));
    }
}

// ============================================================================
// Token Verifier Tests
// ============================================================================

TEST_CASE("TokenVerifier accepts valid tokens", "[jwt][verifier]") {
    SECTION("RS256 with kid") {
        auto verifier = rsa_verifier();
        auto token = sign_token(rsa_key(), "RS256", "rsa-1", claims_for("alice", {"user", "admin"}));

        auto result = verifier.verify(token);
        REQUIRE(result);
        REQUIRE(result.claims.has_value());

        const auto& claims = *result.claims;
        REQUIRE(claims.issuer() == kIssuer);
        REQUIRE(claims.subject() == "user-alice");
        REQUIRE(claims.username() == std::optional<std::string>("alice"));
        REQUIRE(claims.audience() == std::vector<std::string>{"bastion"});
        REQUIRE(claims.roles().size() == 2);
        REQUIRE(claims.has_role("admin"));
        REQUIRE_FALSE(claims.has_role("Admin"));
        REQUIRE(claims.issued_at().has_value());
        REQUIRE(nlohmann::json::parse(claims.raw_payload())["preferred_username"] == "alice");
    }

    SECTION("No kid with a single static key") {
        auto verifier = rsa_verifier();
        auto token = sign_token(rsa_key(), "RS256", "", claims_for("alice"));
        REQUIRE(verifier.verify(token));
    }

    SECTION("ES256") {
        TokenVerifier verifier(verifier_config({JwtAlgorithm::ES256}),
                               static_resolver(ec_key(), "ec-1"));
        auto token = sign_token(ec_key(), "ES256", "ec-1", claims_for("bob"));

        auto result = verifier.verify(token);
        REQUIRE(result);
        REQUIRE(result.claims->username() == std::optional<std::string>("bob"));
    }

    SECTION("RS512 when pinned") {
        auto verifier = rsa_verifier(verifier_config({JwtAlgorithm::RS256, JwtAlgorithm::RS512}));
        auto token = sign_token(rsa_key(), "RS512", "rsa-1", claims_for("alice"));
        REQUIRE(verifier.verify(token));
    }
}

TEST_CASE("TokenVerifier rejects tampered tokens", "[jwt][verifier][security]") {
    auto verifier = rsa_verifier();
    auto token = sign_token(rsa_key(), "RS256", "rsa-1", claims_for("alice"));
    REQUIRE(verifier.verify(token));

    SECTION("Payload swapped for another identity") {
        auto forged = replace_segment(token, 1, base64url_encode(claims_for("bob").dump()));
        auto result = verifier.verify(forged);
        REQUIRE_FALSE(result);
        REQUIRE(result.error == VerificationError::SignatureInvalid);
        REQUIRE_FALSE(result.claims.has_value());
    }

    SECTION("Signature bytes altered") {
        auto second_dot = token.rfind('.');
        std::string forged = token;
        forged[second_dot + 1] = forged[second_dot + 1] == 'A' ? 'B' : 'A';
        auto result = verifier.verify(forged);
        REQUIRE(result.error == VerificationError::SignatureInvalid);
    }

    SECTION("Last signature character altered") {
        // 256 signature bytes take 342 characters; the last one carries 4 spare bits
        auto second_dot = token.rfind('.');
        REQUIRE(token.size() - second_dot - 1 == 342);
        for (char replacement : {'A', 'B', 'Q', 'g', 'w'}) {
            if (token.back() == replacement) {
                continue;
            }
            std::string forged = token;
            forged.back() = replacement;
            CAPTURE(forged.back());
            REQUIRE(verifier.verify(forged).error == VerificationError::SignatureInvalid);
        }
    }

    SECTION("Signed by a different key under the same kid") {
        auto forged = sign_token(other_rsa_key(), "RS256", "rsa-1", claims_for("alice"));
        REQUIRE(verifier.verify(forged).error == VerificationError::SignatureInvalid);
    }

    SECTION("Expired tokens are expired whatever their signature") {
        auto payload = claims_for("alice");
        payload["exp"] = now_seconds() - 60;
        auto forged = sign_token(other_rsa_key(), "RS256", "rsa-1", payload);
        REQUIRE(verifier.verify(forged).error == VerificationError::Expired);

        auto unknown_key = sign_token(rsa_key(), "RS256", "rsa-404", payload);
        REQUIRE(verifier.verify(unknown_key).error == VerificationError::Expired);
    }

    SECTION("Forged expiry does not rescue a bad signature") {
        auto payload = claims_for("alice");
        payload["exp"] = now_seconds() + 86400;
        auto extended = replace_segment(token, 1, base64url_encode(payload.dump()));
        REQUIRE(verifier.verify(extended).error == VerificationError::SignatureInvalid);
    }
}

TEST_CASE("TokenVerifier algorithm pinning", "[jwt][verifier][security]") {
    auto verifier = rsa_verifier();

    SECTION("alg none") {
        auto token = make_token({{"alg", "none"}, {"kid", "rsa-1"}}, claims_for("alice"), "");
        // Empty signature segment is malformed before alg is even read
        REQUIRE_FALSE(verifier.verify(token));

        auto with_sig = make_token({{"alg", "none"}, {"kid", "rsa-1"}}, claims_for("alice"), "x");
        REQUIRE(verifier.verify(with_sig).error == VerificationError::UnsupportedAlgorithm);
    }

    SECTION("HS256 using the public key as a secret") {
        auto token = make_token({{"alg", "HS256"}, {"kid", "rsa-1"}}, claims_for("alice"),
                                "forged-mac");
        REQUIRE(verifier.verify(token).error == VerificationError::UnsupportedAlgorithm);
    }

    SECTION("Supported algorithm outside the allow-list") {
        auto token = sign_token(rsa_key(), "RS384", "rsa-1", claims_for("alice"));
        REQUIRE(verifier.verify(token).error == VerificationError::UnsupportedAlgorithm);
    }

    SECTION("Key pinned to another algorithm") {
        std::vector<SigningKey> keys;
        keys.push_back(static_key(rsa_key(), "rsa-1", JwtAlgorithm::RS256));
        auto resolver = std::make_shared<KeyResolver>(KeyResolverConfig{}, nullptr, std::move(keys));
        TokenVerifier pinned(verifier_config({JwtAlgorithm::RS256, JwtAlgorithm::RS384}), resolver);

        auto token = sign_token(rsa_key(), "RS384", "rsa-1", claims_for("alice"));
        REQUIRE(pinned.verify(token).error == VerificationError::SignatureInvalid);
    }
}

TEST_CASE("TokenVerifier key selection", "[jwt][verifier][keys]") {
    SECTION("Unknown kid") {
        auto verifier = rsa_verifier();
        auto token = sign_token(rsa_key(), "RS256", "someone-else", claims_for("alice"));
        REQUIRE(verifier.verify(token).error == VerificationError::KeyUnavailable);
    }

    SECTION("No kid is ambiguous with several keys") {
        std::vector<SigningKey> keys;
        keys.push_back(static_key(rsa_key(), "rsa-1"));
        keys.push_back(static_key(other_rsa_key(), "rsa-2"));
        auto resolver = std::make_shared<KeyResolver>(KeyResolverConfig{}, nullptr, std::move(keys));
        TokenVerifier verifier(verifier_config(), resolver);

        auto token = sign_token(rsa_key(), "RS256", "", claims_for("alice"));
        REQUIRE(verifier.verify(token).error == VerificationError::KeyUnavailable);

        // kid selects the key, never trial and error
        auto second = sign_token(other_rsa_key(), "RS256", "rsa-2", claims_for("alice"));
        REQUIRE(verifier.verify(second));
        auto crossed = sign_token(other_rsa_key(), "RS256", "rsa-1", claims_for("alice"));
        REQUIRE(verifier.verify(crossed).error == VerificationError::SignatureInvalid);
    }
}

TEST_CASE("TokenVerifier time checks", "[jwt][verifier][time]") {
    const std::time_t now = 1'750'000'000;

    auto signed_with = [](nlohmann::json payload) {
        return sign_token(rsa_key(), "RS256", "rsa-1", payload);
    };

    SECTION("Expired one second ago") {
        auto verifier = rsa_verifier();
        auto payload = claims_for("alice", {}, now);
        payload["exp"] = now - 1;
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now).error ==
                VerificationError::Expired);
    }

    SECTION("exp equal to now is expired") {
        auto verifier = rsa_verifier();
        auto payload = claims_for("alice", {}, now);
        payload["exp"] = now;
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now).error ==
                VerificationError::Expired);

        payload["exp"] = now + 1;
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now));
    }

    SECTION("Clock skew tolerance") {
        auto config = verifier_config();
        config.clock_skew_seconds = 30;
        auto verifier = rsa_verifier(config);

        auto payload = claims_for("alice", {}, now);
        payload["exp"] = now - 10;
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now));

        payload["exp"] = now - 31;
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now).error ==
                VerificationError::Expired);
    }

    SECTION("Not yet valid") {
        auto verifier = rsa_verifier();
        auto payload = claims_for("alice", {}, now);
        payload["nbf"] = now + 60;
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now).error ==
                VerificationError::NotYetValid);

        payload["nbf"] = now;
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now));
    }

    SECTION("Fractional NumericDate") {
        auto verifier = rsa_verifier();
        auto payload = claims_for("alice", {}, now);
        payload["exp"] = static_cast<double>(now) + 30.5;
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now));
    }

    SECTION("NumericDate outside the int64 range") {
        auto verifier = rsa_verifier();
        auto payload = claims_for("alice", {}, now);
        payload["exp"] = 1e300;
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now).error ==
                VerificationError::Malformed);

        payload["exp"] = -1e300;
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now).error ==
                VerificationError::Malformed);

        payload["exp"] = std::numeric_limits<uint64_t>::max();
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now).error ==
                VerificationError::Malformed);
    }

    SECTION("Extreme exp and nbf with clock skew") {
        auto config = verifier_config();
        config.clock_skew_seconds = 60;
        auto verifier = rsa_verifier(config);

        auto payload = claims_for("alice", {}, now);
        payload["exp"] = std::numeric_limits<int64_t>::max();
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now));

        payload["nbf"] = std::numeric_limits<int64_t>::min();
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now));

        payload["exp"] = std::numeric_limits<int64_t>::min();
        payload.erase("nbf");
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now).error ==
                VerificationError::Expired);
    }

    SECTION("exp is mandatory and numeric") {
        auto verifier = rsa_verifier();
        auto payload = claims_for("alice", {}, now);
        payload.erase("exp");
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now).error ==
                VerificationError::Malformed);

        payload["exp"] = "tomorrow";
        REQUIRE(verifier.verify(signed_with(payload), kIssuer, now).error ==
                VerificationError::Malformed);
    }
}

TEST_CASE("TokenVerifier issuer and audience", "[jwt][verifier][claims]") {
    SECTION("Issuer must match exactly") {
        auto verifier = rsa_verifier();
        auto payload = claims_for("alice");
        payload["iss"] = std::string(kIssuer) + "/";
        REQUIRE(verifier.verify(sign_token(rsa_key(), "RS256", "rsa-1", payload)).error ==
                VerificationError::IssuerMismatch);

        payload.erase("iss");
        REQUIRE(verifier.verify(sign_token(rsa_key(), "RS256", "rsa-1", payload)).error ==
                VerificationError::IssuerMismatch);
    }

    SECTION("Explicit expected issuer") {
        auto verifier = rsa_verifier();
        auto token = sign_token(rsa_key(), "RS256", "rsa-1", claims_for("alice"));
        REQUIRE(verifier.verify(token, "https://other.example.com", now_seconds()).error ==
                VerificationError::IssuerMismatch);
    }

    SECTION("Audience checked only when configured") {
        auto payload = claims_for("alice");
        payload["aud"] = nlohmann::json::array({"account", "bastion"});
        auto token = sign_token(rsa_key(), "RS256", "rsa-1", payload);

        REQUIRE(rsa_verifier().verify(token));

        auto config = verifier_config();
        config.audiences = {"bastion"};
        REQUIRE(rsa_verifier(config).verify(token));

        config.audiences = {"billing"};
        REQUIRE(rsa_verifier(config).verify(token).error == VerificationError::AudienceMismatch);
    }
}

TEST_CASE("TokenVerifier identity extraction", "[jwt][verifier][claims]") {
    SECTION("Roles keep token order without duplicates") {
        auto verifier = rsa_verifier();
        auto token = sign_token(rsa_key(), "RS256", "rsa-1",
                                claims_for("alice", {"viewer", "editor", "viewer"}));
        auto result = verifier.verify(token);
        REQUIRE(result);

        std::vector<std::string> roles(result.claims->roles().begin(),
                                       result.claims->roles().end());
        REQUIRE(roles == std::vector<std::string>{"viewer", "editor"});
    }

    SECTION("Space separated roles claim") {
        auto config = verifier_config();
        config.roles_claim = "scope";
        auto verifier = rsa_verifier(config);

        auto payload = claims_for("alice");
        payload["scope"] = "openid profile email";
        auto result = verifier.verify(sign_token(rsa_key(), "RS256", "rsa-1", payload));
        REQUIRE(result);
        REQUIRE(result.claims->has_role("profile"));
        REQUIRE(result.claims->roles().size() == 3);
    }

    SECTION("Missing username claim") {
        auto verifier = rsa_verifier();
        auto payload = claims_for("alice");
        payload.erase("preferred_username");
        auto result = verifier.verify(sign_token(rsa_key(), "RS256", "rsa-1", payload));
        REQUIRE(result);
        REQUIRE_FALSE(result.claims->username().has_value());
    }

    SECTION("Username falls back to subject when enabled") {
        auto config = verifier_config();
        config.username_fallback_to_subject = true;
        auto verifier = rsa_verifier(config);

        auto payload = claims_for("alice");
        payload.erase("preferred_username");
        auto result = verifier.verify(sign_token(rsa_key(), "RS256", "rsa-1", payload));
        REQUIRE(result);
        REQUIRE(result.claims->username() == std::optional<std::string>("user-alice"));
    }

    SECTION("Username is never normalized") {
        auto verifier = rsa_verifier();
        auto result = verifier.verify(sign_token(rsa_key(), "RS256", "rsa-1", claims_for("Alice")));
        REQUIRE(result);
        REQUIRE(result.claims->username() == std::optional<std::string>("Alice"));
    }

    SECTION("Too many roles") {
        std::vector<std::string> roles;
        for (size_t i = 0; i <= MAX_CLAIM_ROLES; ++i) {
            roles.push_back("role-" + std::to_string(i));
        }
        auto verifier = rsa_verifier();
        auto token = sign_token(rsa_key(), "RS256", "rsa-1", claims_for("alice", roles));
        REQUIRE(verifier.verify(token).error == VerificationError::Malformed);
    }
}

TEST_CASE("TokenVerifier malformed input", "[jwt][verifier][malformed]") {
    auto verifier = rsa_verifier();

    REQUIRE(verifier.verify("").error == VerificationError::Missing);

    const std::vector<std::string> malformed = {
        "abc",
        "a.b",
        "a.b.c.d",
        ".b.c",
        "a..c",
        "a.b.",
        "e30.e30.*not-base64*",
        base64url_encode("not json") + "." + base64url_encode("{}") + ".c2ln",
    };
    for (const auto& token : malformed) {
        CAPTURE(token);
        REQUIRE(verifier.verify(token).error == VerificationError::Malformed);
    }

    SECTION("Payload that is not a JSON object") {
        std::string input = base64url_encode(R"({"alg":"RS256","kid":"rsa-1"})") + "." +
                            base64url_encode("[1,2,3]");
        std::string token = input + "." + base64url_encode(sign(rsa_key(), "RS256", input));
        REQUIRE(verifier.verify(token).error == VerificationError::Malformed);
    }

    SECTION("Oversized token") {
        std::string token(MAX_TOKEN_LENGTH + 1, 'a');
        REQUIRE(verifier.verify(token).error == VerificationError::Malformed);
    }
}
