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

// Bastion Authorization Middleware - Header
// Policy decision over the verified identity

#pragma once

#include <memory>
#include <string_view>

#include "pipeline.hpp"
#include "policy.hpp"

namespace bastion::gateway {

/// Policy middleware
/// Must run AFTER JwtAuthMiddleware to have access to verified claims
class PolicyMiddleware : public Middleware {
public:
    explicit PolicyMiddleware(std::shared_ptr<PolicyEngine> engine);
    ~PolicyMiddleware() override = default;

    /// Process request phase (allow or deny)
    [[nodiscard]] MiddlewareResult process_request(RequestContext& ctx) override;

    /// Get middleware name
    [[nodiscard]] std::string_view name() const override { return "PolicyMiddleware"; }

private:
    /// Send 403 Forbidden response
    [[nodiscard]] MiddlewareResult send_403(RequestContext& ctx) const;

    std::shared_ptr<PolicyEngine> engine_;
};

}  // namespace bastion::gateway
