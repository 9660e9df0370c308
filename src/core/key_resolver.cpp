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

// Bastion Key Resolver - Implementation

#include "key_resolver.hpp"

#include <httplib.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>

#include <atomic>
#include <cassert>
#include <future>
#include <mutex>
#include <thread>
#include <nlohmann/json.hpp>

#include "logging.hpp"

namespace bastion::core {

namespace {

using SteadyClock = std::chrono::steady_clock;

/// RSA: Convert n/e (base64url) to EVP_PKEY
EVP_PKEY* rsa_jwk_to_evp_pkey(const JsonWebKey& jwk) {
    auto n_bin = base64url_decode(jwk.n);
    auto e_bin = base64url_decode(jwk.e);

    if (!n_bin.has_value() || !e_bin.has_value() || n_bin->empty() || e_bin->empty()) {
        return nullptr;
    }

    BIGNUM* n_bn = BN_bin2bn(reinterpret_cast<const unsigned char*>(n_bin->data()),
                             static_cast<int>(n_bin->size()), nullptr);
    BIGNUM* e_bn = BN_bin2bn(reinterpret_cast<const unsigned char*>(e_bin->data()),
                             static_cast<int>(e_bin->size()), nullptr);

    if (n_bn == nullptr || e_bn == nullptr) {
        BN_free(n_bn);
        BN_free(e_bn);
        return nullptr;
    }

    RSA* rsa = RSA_new();
    if (rsa == nullptr) {
        BN_free(n_bn);
        BN_free(e_bn);
        return nullptr;
    }

    // RSA takes ownership of n and e on success
    if (RSA_set0_key(rsa, n_bn, e_bn, nullptr) != 1) {
        RSA_free(rsa);
        BN_free(n_bn);
        BN_free(e_bn);
        return nullptr;
    }

    EVP_PKEY* pkey = EVP_PKEY_new();
    if (pkey == nullptr) {
        RSA_free(rsa);
        return nullptr;
    }

    if (EVP_PKEY_assign_RSA(pkey, rsa) != 1) {
        EVP_PKEY_free(pkey);
        RSA_free(rsa);
        return nullptr;
    }

    return pkey;
}

/// EC: Convert crv/x/y (base64url) to EVP_PKEY
EVP_PKEY* ec_jwk_to_evp_pkey(const JsonWebKey& jwk) {
    // Only P-256 supported (ES256)
    if (jwk.crv != "P-256") {
        return nullptr;
    }

    auto x_bin = base64url_decode(jwk.x);
    auto y_bin = base64url_decode(jwk.y);

    if (!x_bin.has_value() || !y_bin.has_value() || x_bin->size() != 32 || y_bin->size() != 32) {
        return nullptr;
    }

    BIGNUM* x_bn = BN_bin2bn(reinterpret_cast<const unsigned char*>(x_bin->data()),
                             static_cast<int>(x_bin->size()), nullptr);
    BIGNUM* y_bn = BN_bin2bn(reinterpret_cast<const unsigned char*>(y_bin->data()),
                             static_cast<int>(y_bin->size()), nullptr);

    if (x_bn == nullptr || y_bn == nullptr) {
        BN_free(x_bn);
        BN_free(y_bn);
        return nullptr;
    }

    EC_KEY* ec_key = EC_KEY_new_by_curve_name(NID_X9_62_prime256v1);
    if (ec_key == nullptr) {
        BN_free(x_bn);
        BN_free(y_bn);
        return nullptr;
    }

    // Rejects points that are not on the curve
    int rc = EC_KEY_set_public_key_affine_coordinates(ec_key, x_bn, y_bn);
    BN_free(x_bn);
    BN_free(y_bn);

    if (rc != 1) {
        EC_KEY_free(ec_key);
        return nullptr;
    }

    EVP_PKEY* pkey = EVP_PKEY_new();
    if (pkey == nullptr) {
        EC_KEY_free(ec_key);
        return nullptr;
    }

    if (EVP_PKEY_assign_EC_KEY(pkey, ec_key) != 1) {
        EVP_PKEY_free(pkey);
        EC_KEY_free(ec_key);
        return nullptr;
    }

    return pkey;
}

std::string json_string(const nlohmann::json& j, const char* name, const char* fallback = "") {
    auto it = j.find(name);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

}  // namespace

// ============================================================================
// JsonWebKey Implementation
// ============================================================================

std::optional<JsonWebKey> JsonWebKey::parse(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    JsonWebKey jwk;
    jwk.kty = json_string(j, "kty");
    jwk.alg = json_string(j, "alg");
    jwk.kid = json_string(j, "kid");
    jwk.use = json_string(j, "use", "sig");  // Default to signature

    if (jwk.kty == "RSA") {
        jwk.n = json_string(j, "n");
        jwk.e = json_string(j, "e");
    } else if (jwk.kty == "EC") {
        jwk.crv = json_string(j, "crv");
        jwk.x = json_string(j, "x");
        jwk.y = json_string(j, "y");
    }

    return jwk;
}

std::optional<std::vector<JsonWebKey>> parse_jwks(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);

        // JWKS format: { "keys": [ {...}, {...} ] }
        if (!j.is_object() || !j.contains("keys") || !j["keys"].is_array()) {
            return std::nullopt;
        }

        std::vector<JsonWebKey> jwks;
        for (const auto& jwk_json : j["keys"]) {
            auto jwk = JsonWebKey::parse(jwk_json);
            if (jwk.has_value()) {
                jwks.push_back(std::move(*jwk));
            }
        }

        return jwks;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<SigningKey> jwk_to_signing_key(const JsonWebKey& jwk) {
    // Encryption keys and keys without an id are never selectable
    if (jwk.use != "sig" || jwk.kid.empty()) {
        return std::nullopt;
    }

    std::optional<JwtAlgorithm> alg;
    if (!jwk.alg.empty()) {
        alg = parse_algorithm(jwk.alg);
        if (!alg.has_value()) {
            return std::nullopt;  // HS*, RSA-OAEP, PS*, ... are not ours to verify
        }
    }

    SigningKey key;
    key.key_id = jwk.kid;
    key.algorithm = alg;
    key.fetched_at = std::chrono::system_clock::now();

    if (jwk.kty == "RSA") {
        key.public_key = rsa_jwk_to_evp_pkey(jwk);
    } else if (jwk.kty == "EC") {
        key.public_key = ec_jwk_to_evp_pkey(jwk);
    } else {
        return std::nullopt;
    }

    if (key.public_key == nullptr) {
        return std::nullopt;
    }

    if (alg.has_value() && !key.accepts(*alg)) {
        return std::nullopt;
    }

    return key;
}

// ============================================================================
// HttpJwksSource Implementation
// ============================================================================

HttpJwksSource::HttpJwksSource(std::string url, std::chrono::milliseconds timeout)
    : url_(std::move(url)), timeout_(timeout) {
    // Split scheme://host[:port] from the path
    size_t scheme_end = url_.find("://");
    size_t path_start =
        url_.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);

    if (path_start == std::string::npos) {
        base_url_ = url_;
        path_ = "/";
    } else {
        base_url_ = url_.substr(0, path_start);
        path_ = url_.substr(path_start);
    }
}

std::optional<std::string> HttpJwksSource::fetch() {
    auto* logger = logging::get_current_logger();
    assert(logger && "Logger must be initialized");

    try {
        httplib::Client client(base_url_);
        client.set_connection_timeout(timeout_);
        client.set_read_timeout(timeout_);
        // Redirects are not followed: keys only ever come from the configured origin
        client.set_follow_location(false);

        auto res = client.Get(path_);
        if (!res) {
            LOG_WARNING(logger, "JWKS fetch failed: url={}, error={}", url_,
                        httplib::to_string(res.error()));
            return std::nullopt;
        }

        if (res->status != 200) {
            LOG_WARNING(logger, "JWKS fetch failed: url={}, status={}", url_, res->status);
            return std::nullopt;
        }

        return res->body;
    } catch (const std::exception& e) {
        LOG_WARNING(logger, "JWKS fetch failed: url={}, error={}", url_, e.what());
        return std::nullopt;
    }
}

// ============================================================================
// KeyResolver Implementation
// ============================================================================

struct KeyResolver::State {
    struct CachedKey {
        std::shared_ptr<const SigningKey> key;
        SteadyClock::time_point expires_at;
    };

    /// Immutable once published
    struct KeySet {
        string_map<CachedKey> keys;
    };

    KeyResolverConfig config;
    std::shared_ptr<JwksSource> source;
    string_map<std::shared_ptr<const SigningKey>> static_keys;  // Never expire

    // RCU pattern: readers load, the single publisher stores a rebuilt set
    std::atomic<std::shared_ptr<const KeySet>> keys{std::make_shared<const KeySet>()};
    std::mutex publish_mutex;

    // Singleflight: one shared outcome per kid being fetched
    std::mutex inflight_mutex;
    string_map<std::shared_future<bool>> inflight;

    std::atomic<uint64_t> fetches{0};

    [[nodiscard]] std::shared_ptr<const SigningKey> lookup(std::string_view key_id,
                                                           SteadyClock::time_point now) const {
        auto snapshot = keys.load();
        auto it = snapshot->keys.find(key_id);
        if (it == snapshot->keys.end() || it->second.expires_at <= now) {
            return nullptr;
        }
        return it->second.key;
    }

    [[nodiscard]] bool fetch_and_publish() {
        auto* logger = logging::get_current_logger();
        assert(logger && "Logger must be initialized");

        fetches.fetch_add(1, std::memory_order_relaxed);

        auto body = source->fetch();
        if (!body.has_value()) {
            return false;
        }

        auto jwks = parse_jwks(*body);
        if (!jwks.has_value()) {
            LOG_WARNING(logger, "JWKS document malformed: source={}", source->describe());
            return false;
        }

        std::vector<std::shared_ptr<const SigningKey>> fresh;
        for (const auto& jwk : *jwks) {
            auto key = jwk_to_signing_key(jwk);
            if (key.has_value()) {
                fresh.push_back(std::make_shared<const SigningKey>(std::move(*key)));
            } else {
                LOG_DEBUG(logger, "JWKS entry skipped: kid={}, kty={}, use={}, alg={}", jwk.kid,
                          jwk.kty, jwk.use, jwk.alg);
            }
        }

        if (fresh.empty()) {
            LOG_WARNING(logger, "JWKS contained no usable signing key: source={}",
                        source->describe());
            return false;
        }

        const auto now = SteadyClock::now();
        const auto expires_at = now + config.cache_ttl;

        {
            std::lock_guard<std::mutex> lock(publish_mutex);

            // Keep unexpired keys that rotated out of the document, replace the rest
            auto current = keys.load();
            auto next = std::make_shared<KeySet>();
            for (const auto& [kid, cached] : current->keys) {
                if (cached.expires_at > now) {
                    next->keys.emplace(kid, cached);
                }
            }
            for (auto& key : fresh) {
                next->keys.insert_or_assign(key->key_id, CachedKey{key, expires_at});
            }

            keys.store(std::move(next));
        }

        LOG_INFO(logger, "JWKS refreshed: source={}, keys={}", source->describe(), fresh.size());
        return true;
    }
};

KeyResolver::KeyResolver(KeyResolverConfig config, std::shared_ptr<JwksSource> source,
                         std::vector<SigningKey> static_keys)
    : state_(std::make_shared<State>()) {
    state_->config = config;
    state_->source = std::move(source);
    for (auto& key : static_keys) {
        std::string kid = key.key_id;
        state_->static_keys.insert_or_assign(std::move(kid),
                                             std::make_shared<const SigningKey>(std::move(key)));
    }
}

std::shared_ptr<const SigningKey> KeyResolver::resolve(std::string_view key_id) {
    auto* logger = logging::get_current_logger();
    assert(logger && "Logger must be initialized");

    // No kid: only unambiguous with a single pinned key, never trial-and-error
    if (key_id.empty()) {
        if (state_->static_keys.size() == 1) {
            return state_->static_keys.begin()->second;
        }
        return nullptr;
    }

    auto static_it = state_->static_keys.find(key_id);
    if (static_it != state_->static_keys.end()) {
        return static_it->second;
    }

    // Fast path: lock-free snapshot read
    if (auto key = state_->lookup(key_id, SteadyClock::now())) {
        return key;
    }

    if (!state_->source) {
        return nullptr;
    }

    std::shared_future<bool> pending;
    {
        std::lock_guard<std::mutex> lock(state_->inflight_mutex);

        // A fetch may have published between the snapshot read and the lock
        if (auto key = state_->lookup(key_id, SteadyClock::now())) {
            return key;
        }

        auto it = state_->inflight.find(key_id);
        if (it != state_->inflight.end()) {
            pending = it->second;
        } else {
            auto promise = std::make_shared<std::promise<bool>>();
            pending = promise->get_future().share();
            state_->inflight.emplace(std::string(key_id), pending);

            try {
                // Detached: a waiter that times out must not keep the fetch alive
                std::thread([state = state_, kid = std::string(key_id), promise]() {
                    bool ok = false;
                    try {
                        ok = state->fetch_and_publish();
                    } catch (const std::exception& e) {
                        auto* thread_logger = logging::get_current_logger();
                        assert(thread_logger && "Logger must be initialized");
                        LOG_ERROR(thread_logger, "JWKS fetch raised: kid={}, error={}", kid,
                                  e.what());
                    }

                    {
                        std::lock_guard<std::mutex> guard(state->inflight_mutex);
                        state->inflight.erase(kid);
                    }
                    promise->set_value(ok);
                }).detach();
            } catch (const std::system_error& e) {
                state_->inflight.erase(std::string(key_id));
                LOG_ERROR(logger, "JWKS fetch thread failed to start: kid={}, error={}", key_id,
                          e.what());
                return nullptr;
            }
        }
    }

    if (pending.wait_for(state_->config.fetch_timeout) != std::future_status::ready) {
        LOG_WARNING(logger, "JWKS fetch timed out: kid={}, timeout_ms={}", key_id,
                    state_->config.fetch_timeout.count());
        return nullptr;
    }

    return state_->lookup(key_id, SteadyClock::now());
}

bool KeyResolver::prefetch() {
    if (!state_->source) {
        return false;
    }
    return state_->fetch_and_publish();
}

size_t KeyResolver::cached_key_count() const {
    return state_->keys.load()->keys.size();
}

uint64_t KeyResolver::fetch_count() const noexcept {
    return state_->fetches.load(std::memory_order_relaxed);
}

}  // namespace bastion::core
