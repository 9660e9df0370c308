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

// Bastion Policy Engine - Header
// Ordered allow/deny rules over verified identities (first match wins, default deny)

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../core/jwt.hpp"
#include "../http/http.hpp"

namespace bastion::gateway {

enum class Effect : uint8_t { Allow, Deny };

enum class PathMatch : uint8_t { Prefix, Exact };

/// Any verified identity
struct AnyAuthenticated {};

/// Username equals the literal (case-sensitive, roles are not consulted)
struct UsernameEquals {
    std::string username;
};

/// Role list contains the literal (case-sensitive)
struct RoleContains {
    std::string role;
};

using Principal = std::variant<AnyAuthenticated, UsernameEquals, RoleContains>;

/// Access rule
struct Rule {
    std::string id;
    Effect effect = Effect::Deny;
    std::string path;
    PathMatch match = PathMatch::Prefix;
    std::vector<http::Method> methods;  // Empty = any method
    Principal principal = AnyAuthenticated{};

    [[nodiscard]] bool matches(http::Method method, std::string_view path,
                               const core::Claims& claims) const;
};

/// Policy decision
struct Decision {
    Effect effect = Effect::Deny;
    std::string rule_id;  // Empty for the default deny

    [[nodiscard]] bool allowed() const noexcept { return effect == Effect::Allow; }
    [[nodiscard]] bool is_default() const noexcept { return rule_id.empty(); }
};

/// Policy engine over an immutable rule list.
/// decide() is a pure function of (rules, request, claims); reload() swaps the list.
class PolicyEngine {
public:
    /// Throws std::invalid_argument when the rule list is empty or invalid
    explicit PolicyEngine(std::vector<Rule> rules);
    ~PolicyEngine() = default;

    // Non-copyable, non-movable
    PolicyEngine(const PolicyEngine&) = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;
    PolicyEngine(PolicyEngine&&) = delete;
    PolicyEngine& operator=(PolicyEngine&&) = delete;

    /// First rule matching (method, path, identity) decides. No claims or no match denies.
    [[nodiscard]] Decision decide(http::Method method, std::string_view path,
                                  const core::Claims* claims) const;

    /// Replace the rules; the old list stays active when the new one is invalid
    [[nodiscard]] bool reload(std::vector<Rule> rules);

    /// Number of rules in the active list
    [[nodiscard]] size_t size() const;

    /// Problems with a rule list (empty when valid)
    [[nodiscard]] static std::vector<std::string> validate(const std::vector<Rule>& rules);

private:
    using RuleList = std::vector<Rule>;

    std::atomic<std::shared_ptr<const RuleList>> rules_;
};

[[nodiscard]] std::string_view to_string(Effect effect) noexcept;

}  // namespace bastion::gateway
