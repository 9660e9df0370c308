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

// Bastion JWT Verification - Implementation

#include "jwt.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include "key_resolver.hpp"
#include "string_utils.hpp"

namespace bastion::core {

// ============================================================================
// Utility Functions: Base64 / Base64url encoding
// ============================================================================

std::string base64_encode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL
    std::string result(4 * ((input.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(result.data()),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    result.resize(static_cast<size_t>(written));
    return result;
}

std::string base64url_encode(std::string_view input) {
    std::string result = base64_encode(input);

    // Convert base64 to base64url (RFC 4648)
    // Replace '+' with '-', '/' with '_', remove '='
    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());

    return result;
}

std::optional<std::string> base64url_decode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    // A single leftover character can never encode a whole byte
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    // Convert base64url to standard base64, rejecting anything outside the alphabet
    std::string base64;
    base64.reserve(input.size() + 3);
    int last_value = 0;
    for (char c : input) {
        if (c >= 'A' && c <= 'Z') {
            last_value = c - 'A';
        } else if (c >= 'a' && c <= 'z') {
            last_value = c - 'a' + 26;
        } else if (c >= '0' && c <= '9') {
            last_value = c - '0' + 52;
        } else if (c == '-') {
            last_value = 62;
        } else if (c == '_') {
            last_value = 63;
        } else {
            return std::nullopt;
        }
        base64.push_back(c == '-' ? '+' : c == '_' ? '/' : c);
    }

    // Only the canonical encoding is accepted: the bits past the last whole
    // byte must be zero, so no two segments decode to the same bytes
    if ((input.size() % 4 == 2 && (last_value & 0x0F) != 0) ||
        (input.size() % 4 == 3 && (last_value & 0x03) != 0)) {
        return std::nullopt;
    }

    // Add padding if needed
    size_t padding = (4 - (base64.size() % 4)) % 4;
    base64.append(padding, '=');

    std::string decoded(base64.size() / 4 * 3, '\0');
    int decoded_size = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
                                       reinterpret_cast<const unsigned char*>(base64.data()),
                                       static_cast<int>(base64.size()));
    if (decoded_size < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    decoded.resize(static_cast<size_t>(decoded_size) - padding);
    return decoded;
}

// ============================================================================
// Algorithm Utilities
// ============================================================================

std::optional<JwtAlgorithm> parse_algorithm(std::string_view alg_str) {
    if (alg_str == "RS256") {
        return JwtAlgorithm::RS256;
    } else if (alg_str == "RS384") {
        return JwtAlgorithm::RS384;
    } else if (alg_str == "RS512") {
        return JwtAlgorithm::RS512;
    } else if (alg_str == "ES256") {
        return JwtAlgorithm::ES256;
    }
    return std::nullopt;
}

std::string_view algorithm_to_string(JwtAlgorithm alg) {
    switch (alg) {
        case JwtAlgorithm::RS256:
            return "RS256";
        case JwtAlgorithm::RS384:
            return "RS384";
        case JwtAlgorithm::RS512:
            return "RS512";
        case JwtAlgorithm::ES256:
            return "ES256";
    }
    return "unknown";
}

std::string_view to_string(VerificationError error) noexcept {
    switch (error) {
        case VerificationError::Missing:
            return "missing";
        case VerificationError::Malformed:
            return "malformed";
        case VerificationError::UnsupportedAlgorithm:
            return "unsupported_algorithm";
        case VerificationError::SignatureInvalid:
            return "signature_invalid";
        case VerificationError::Expired:
            return "expired";
        case VerificationError::NotYetValid:
            return "not_yet_valid";
        case VerificationError::IssuerMismatch:
            return "issuer_mismatch";
        case VerificationError::AudienceMismatch:
            return "audience_mismatch";
        case VerificationError::KeyUnavailable:
            return "key_unavailable";
    }
    return "unknown";
}

namespace {

const EVP_MD* digest_for(JwtAlgorithm alg) {
    switch (alg) {
        case JwtAlgorithm::RS256:
        case JwtAlgorithm::ES256:
            return EVP_sha256();
        case JwtAlgorithm::RS384:
            return EVP_sha384();
        case JwtAlgorithm::RS512:
            return EVP_sha512();
    }
    return nullptr;
}

bool key_type_fits(EVP_PKEY* pkey, JwtAlgorithm alg) {
    int key_type = EVP_PKEY_base_id(pkey);
    switch (alg) {
        case JwtAlgorithm::RS256:
        case JwtAlgorithm::RS384:
        case JwtAlgorithm::RS512:
            return key_type == EVP_PKEY_RSA;
        case JwtAlgorithm::ES256:
            return key_type == EVP_PKEY_EC && EVP_PKEY_bits(pkey) == 256;
    }
    return false;
}

// JWS carries ECDSA signatures as fixed-width r||s; OpenSSL verifies DER
std::optional<std::string> ecdsa_raw_to_der(std::string_view raw) {
    constexpr size_t kP256CoordinateSize = 32;
    if (raw.size() != 2 * kP256CoordinateSize) {
        return std::nullopt;
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(raw.data());
    BIGNUM* r = BN_bin2bn(bytes, kP256CoordinateSize, nullptr);
    BIGNUM* s = BN_bin2bn(bytes + kP256CoordinateSize, kP256CoordinateSize, nullptr);
    ECDSA_SIG* sig = ECDSA_SIG_new();

    if (r == nullptr || s == nullptr || sig == nullptr) {
        BN_free(r);
        BN_free(s);
        ECDSA_SIG_free(sig);
        return std::nullopt;
    }

    // ECDSA_SIG takes ownership of r and s on success
    if (ECDSA_SIG_set0(sig, r, s) != 1) {
        BN_free(r);
        BN_free(s);
        ECDSA_SIG_free(sig);
        return std::nullopt;
    }

    int der_len = i2d_ECDSA_SIG(sig, nullptr);
    if (der_len <= 0) {
        ECDSA_SIG_free(sig);
        return std::nullopt;
    }

    std::string der(static_cast<size_t>(der_len), '\0');
    auto* out = reinterpret_cast<unsigned char*>(der.data());
    i2d_ECDSA_SIG(sig, &out);
    ECDSA_SIG_free(sig);

    return der;
}

// Claim lookup by exact name first (URIs contain dots), then by dotted path
const nlohmann::json* find_claim(const nlohmann::json& payload, const std::string& name) {
    auto it = payload.find(name);
    if (it != payload.end()) {
        return &*it;
    }

    const nlohmann::json* node = &payload;
    for (auto segment : split(name, '.')) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto child = node->find(std::string(segment));
        if (child == node->end()) {
            return nullptr;
        }
        node = &*child;
    }
    return node == &payload ? nullptr : node;
}

// NumericDate may be fractional (RFC 7519 section 2); values outside int64 are malformed
std::optional<int64_t> numeric_date(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        auto seconds = value.get<uint64_t>();
        if (seconds > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(seconds);
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        // 2^63 is exact as a double; anything at or past it does not fit
        constexpr double kInt64Bound = 9223372036854775808.0;
        double seconds = std::floor(value.get<double>());
        if (!std::isfinite(seconds) || seconds < -kInt64Bound || seconds >= kInt64Bound) {
            return std::nullopt;
        }
        return static_cast<int64_t>(seconds);
    }
    return std::nullopt;
}

// now >= exp + skew, without overflowing near the int64 limits
bool is_expired(int64_t now, int64_t exp, int64_t skew) noexcept {
    skew = std::max<int64_t>(skew, 0);
    if (exp > std::numeric_limits<int64_t>::max() - skew) {
        return false;
    }
    return now >= exp + skew;
}

// now < nbf - skew, same overflow guard
bool is_not_yet_valid(int64_t now, int64_t nbf, int64_t skew) noexcept {
    skew = std::max<int64_t>(skew, 0);
    if (nbf < std::numeric_limits<int64_t>::min() + skew) {
        return false;
    }
    return now < nbf - skew;
}

// Expiry read from a payload whose signature has not been checked yet.
// Only ever used to reject; the verified payload is checked again later.
bool expired_before_verification(std::string_view payload_json, std::time_t now,
                                 int64_t skew) {
    auto payload = nlohmann::json::parse(payload_json, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return false;
    }
    auto exp_it = payload.find("exp");
    if (exp_it == payload.end()) {
        return false;
    }
    auto exp = numeric_date(*exp_it);
    return exp && is_expired(static_cast<int64_t>(now), *exp, skew);
}

}  // namespace

// ============================================================================
// JwtHeader Implementation
// ============================================================================

std::optional<JwtHeader> JwtHeader::parse(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::nullopt;
        }

        // alg is required and must be a string
        auto alg = j.find("alg");
        if (alg == j.end() || !alg->is_string()) {
            return std::nullopt;
        }

        JwtHeader header;
        header.alg = alg->get<std::string>();

        auto typ = j.find("typ");
        header.type = (typ != j.end() && typ->is_string()) ? typ->get<std::string>() : "JWT";

        auto kid = j.find("kid");
        if (kid != j.end()) {
            if (!kid->is_string()) {
                return std::nullopt;
            }
            header.key_id = kid->get<std::string>();
        }

        return header;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// SigningKey Implementation
// ============================================================================

SigningKey::~SigningKey() {
    if (public_key) {
        EVP_PKEY_free(public_key);
        public_key = nullptr;
    }
}

SigningKey::SigningKey(SigningKey&& other) noexcept
    : key_id(std::move(other.key_id)),
      algorithm(other.algorithm),
      public_key(other.public_key),
      fetched_at(other.fetched_at) {
    other.public_key = nullptr;
}

SigningKey& SigningKey::operator=(SigningKey&& other) noexcept {
    if (this != &other) {
        if (public_key) {
            EVP_PKEY_free(public_key);
        }

        key_id = std::move(other.key_id);
        algorithm = other.algorithm;
        public_key = other.public_key;
        fetched_at = other.fetched_at;

        other.public_key = nullptr;
    }
    return *this;
}

bool SigningKey::accepts(JwtAlgorithm alg) const noexcept {
    if (public_key == nullptr) {
        return false;
    }
    if (algorithm.has_value() && *algorithm != alg) {
        return false;
    }
    return key_type_fits(public_key, alg);
}

bool SigningKey::verify(JwtAlgorithm alg, std::string_view message,
                        std::string_view signature) const {
    if (!accepts(alg)) {
        return false;
    }

    std::string der;
    if (alg == JwtAlgorithm::ES256) {
        auto converted = ecdsa_raw_to_der(signature);
        if (!converted) {
            return false;
        }
        der = std::move(*converted);
        signature = der;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return false;
    }

    // EVP_DigestVerifyFinal compares in constant time
    bool valid = false;
    if (EVP_DigestVerifyInit(ctx, nullptr, digest_for(alg), nullptr, public_key) == 1) {
        if (EVP_DigestVerifyUpdate(ctx, message.data(), message.size()) == 1) {
            if (EVP_DigestVerifyFinal(ctx, reinterpret_cast<const unsigned char*>(signature.data()),
                                      signature.size()) == 1) {
                valid = true;
            }
        }
    }

    EVP_MD_CTX_free(ctx);
    return valid;
}

std::optional<SigningKey> SigningKey::load_public_key(std::optional<JwtAlgorithm> alg,
                                                     std::string_view key_id,
                                                     std::string_view pem_path) {
    std::ifstream file{std::string(pem_path)};
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_pem(alg, key_id, buffer.str());
}

std::optional<SigningKey> SigningKey::from_pem(std::optional<JwtAlgorithm> alg,
                                               std::string_view key_id, std::string_view pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return std::nullopt;
    }

    EVP_PKEY* pkey = PEM_read_bio_PUBKEY(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!pkey) {
        return std::nullopt;
    }

    SigningKey key;
    key.key_id = std::string(key_id);
    key.algorithm = alg;
    key.public_key = pkey;
    key.fetched_at = std::chrono::system_clock::now();

    // Validate key type matches algorithm (or at least one supported family)
    if (alg.has_value()) {
        if (!key_type_fits(pkey, *alg)) {
            return std::nullopt;
        }
    } else if (!key_type_fits(pkey, JwtAlgorithm::RS256) &&
               !key_type_fits(pkey, JwtAlgorithm::ES256)) {
        return std::nullopt;
    }

    return key;
}

// ============================================================================
// Claims Implementation
// ============================================================================

bool Claims::has_role(std::string_view role) const {
    return roles_.contains(std::string(role));
}

// ============================================================================
// TokenVerifier Implementation
// ============================================================================

TokenVerifier::TokenVerifier(VerifierConfig config, std::shared_ptr<KeyResolver> keys)
    : config_(std::move(config)), keys_(std::move(keys)) {
    assert(keys_ && "KeyResolver must not be null");
}

bool TokenVerifier::algorithm_allowed(JwtAlgorithm alg) const noexcept {
    return std::find(config_.algorithms.begin(), config_.algorithms.end(), alg) !=
           config_.algorithms.end();
}

VerifyResult TokenVerifier::verify(std::string_view token) const {
    return verify(token, config_.issuer, std::time(nullptr));
}

VerifyResult TokenVerifier::verify(std::string_view token, std::string_view expected_issuer,
                                   std::time_t now) const {
    if (token.empty()) {
        return VerifyResult::failure(VerificationError::Missing);
    }

    if (token.size() > MAX_TOKEN_LENGTH) {
        return VerifyResult::failure(VerificationError::Malformed);
    }

    // STEP 1: Split token into exactly three non-empty segments
    size_t first_dot = token.find('.');
    size_t second_dot =
        first_dot == std::string_view::npos ? std::string_view::npos : token.find('.', first_dot + 1);
    if (second_dot == std::string_view::npos ||
        token.find('.', second_dot + 1) != std::string_view::npos) {
        return VerifyResult::failure(VerificationError::Malformed);
    }

    std::string_view header_part = token.substr(0, first_dot);
    std::string_view payload_part = token.substr(first_dot + 1, second_dot - first_dot - 1);
    std::string_view signature_part = token.substr(second_dot + 1);
    if (header_part.empty() || payload_part.empty() || signature_part.empty()) {
        return VerifyResult::failure(VerificationError::Malformed);
    }

    // STEP 2: Base64url decode header and payload (the signature is decoded
    // with the key check, so a damaged signature segment is SignatureInvalid)
    auto header_json = base64url_decode(header_part);
    auto payload_json = base64url_decode(payload_part);
    if (!header_json || !payload_json) {
        return VerifyResult::failure(VerificationError::Malformed);
    }

    // STEP 3: Parse header and pin the algorithm
    auto header = JwtHeader::parse(*header_json);
    if (!header) {
        return VerifyResult::failure(VerificationError::Malformed);
    }

    auto alg = parse_algorithm(header->alg);
    if (!alg || !algorithm_allowed(*alg)) {
        return VerifyResult::failure(VerificationError::UnsupportedAlgorithm);
    }

    // Expired tokens are rejected as expired whatever their signature
    if (expired_before_verification(*payload_json, now, config_.clock_skew_seconds)) {
        return VerifyResult::failure(VerificationError::Expired);
    }

    // STEP 4: Select the key by kid only
    auto key = keys_->resolve(header->key_id);
    if (!key) {
        return VerifyResult::failure(VerificationError::KeyUnavailable);
    }

    // STEP 5: Verify signature over "header.payload"
    std::string_view message = token.substr(0, second_dot);
    auto signature = base64url_decode(signature_part);
    if (!signature || !key->verify(*alg, message, *signature)) {
        return VerifyResult::failure(VerificationError::SignatureInvalid);
    }

    // STEP 6: Validate claims
    return check_claims(std::move(*payload_json), expected_issuer, now);
}

VerifyResult TokenVerifier::check_claims(std::string payload_json,
                                         std::string_view expected_issuer,
                                         std::time_t now) const {
    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(payload_json);
    } catch (const nlohmann::json::exception&) {
        return VerifyResult::failure(VerificationError::Malformed);
    }

    if (!payload.is_object()) {
        return VerifyResult::failure(VerificationError::Malformed);
    }

    // exp is mandatory
    auto exp_it = payload.find("exp");
    if (exp_it == payload.end()) {
        return VerifyResult::failure(VerificationError::Malformed);
    }
    auto exp = numeric_date(*exp_it);
    if (!exp) {
        return VerifyResult::failure(VerificationError::Malformed);
    }

    std::optional<int64_t> nbf;
    auto nbf_it = payload.find("nbf");
    if (nbf_it != payload.end()) {
        nbf = numeric_date(*nbf_it);
        if (!nbf) {
            return VerifyResult::failure(VerificationError::Malformed);
        }
    }

    // Check issuer (iss) - exact string match
    auto iss_it = payload.find("iss");
    if (iss_it == payload.end() || !iss_it->is_string() ||
        iss_it->get_ref<const std::string&>() != expected_issuer) {
        return VerifyResult::failure(VerificationError::IssuerMismatch);
    }

    // Check expiration (exp) - with clock skew tolerance
    const int64_t current = static_cast<int64_t>(now);
    if (is_expired(current, *exp, config_.clock_skew_seconds)) {
        return VerifyResult::failure(VerificationError::Expired);
    }

    // Check not-before (nbf) - with clock skew tolerance
    if (nbf && is_not_yet_valid(current, *nbf, config_.clock_skew_seconds)) {
        return VerifyResult::failure(VerificationError::NotYetValid);
    }

    Claims claims;
    claims.issuer_ = iss_it->get<std::string>();
    claims.expires_at_ = *exp;
    claims.not_before_ = nbf;

    // Audience (aud) - string or array of strings
    auto aud_it = payload.find("aud");
    if (aud_it != payload.end()) {
        if (aud_it->is_string()) {
            claims.audience_.push_back(aud_it->get<std::string>());
        } else if (aud_it->is_array()) {
            for (const auto& entry : *aud_it) {
                if (entry.is_string()) {
                    claims.audience_.push_back(entry.get<std::string>());
                }
            }
        } else {
            return VerifyResult::failure(VerificationError::Malformed);
        }
    }

    if (!config_.audiences.empty()) {
        bool matched = std::any_of(
            claims.audience_.begin(), claims.audience_.end(), [this](const std::string& aud) {
                return std::find(config_.audiences.begin(), config_.audiences.end(), aud) !=
                       config_.audiences.end();
            });
        if (!matched) {
            return VerifyResult::failure(VerificationError::AudienceMismatch);
        }
    }

    auto sub_it = payload.find("sub");
    if (sub_it != payload.end() && sub_it->is_string()) {
        claims.subject_ = sub_it->get<std::string>();
    }

    auto iat_it = payload.find("iat");
    if (iat_it != payload.end()) {
        claims.issued_at_ = numeric_date(*iat_it);
    }

    // Username from the configured claim; never normalized
    const nlohmann::json* username = find_claim(payload, config_.username_claim);
    if (username != nullptr && username->is_string() &&
        !username->get_ref<const std::string&>().empty()) {
        claims.username_ = username->get<std::string>();
    } else if (config_.username_fallback_to_subject && !claims.subject_.empty()) {
        claims.username_ = claims.subject_;
    }

    // Roles: JSON array of strings or a space-separated string
    const nlohmann::json* roles = find_claim(payload, config_.roles_claim);
    if (roles != nullptr) {
        if (roles->is_array()) {
            for (const auto& role : *roles) {
                if (role.is_string()) {
                    claims.roles_.insert(role.get<std::string>());
                }
            }
        } else if (roles->is_string()) {
            for (auto role : split(roles->get_ref<const std::string&>(), ' ')) {
                claims.roles_.emplace(role);
            }
        }

        if (claims.roles_.size() > MAX_CLAIM_ROLES) {
            return VerifyResult::failure(VerificationError::Malformed);
        }
    }

    claims.raw_payload_ = std::move(payload_json);

    return VerifyResult::success(std::move(claims));
}

}  // namespace bastion::core
