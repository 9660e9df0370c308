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

// Bastion JWT Authentication Middleware - Header

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "../core/jwt.hpp"
#include "pipeline.hpp"

namespace bastion::gateway {

/// JWT authentication middleware (request phase, first stage)
class JwtAuthMiddleware : public Middleware {
public:
    struct Config {
        std::string header = "Authorization";  // Header name
        std::string scheme = "Bearer";         // "Bearer <token>", compared case-insensitively
        std::string realm = "bastion";         // WWW-Authenticate realm
    };

    JwtAuthMiddleware(Config config, std::shared_ptr<core::TokenVerifier> verifier);
    ~JwtAuthMiddleware() override = default;

    /// Process request phase (verify the bearer token)
    [[nodiscard]] MiddlewareResult process_request(RequestContext& ctx) override;

    /// Get middleware name
    [[nodiscard]] std::string_view name() const override { return "JwtAuthMiddleware"; }

    /// Token from a header value; nullopt when the scheme or shape is wrong
    [[nodiscard]] std::optional<std::string_view> extract_token(std::string_view header_value) const;

private:
    /// Send 401 Unauthorized response
    [[nodiscard]] MiddlewareResult send_401(RequestContext& ctx, core::VerificationError error) const;

    Config config_;
    std::shared_ptr<core::TokenVerifier> verifier_;
};

}  // namespace bastion::gateway
