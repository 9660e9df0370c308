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

// Bastion Policy Engine - Implementation

#include "policy.hpp"

#include <algorithm>
#include <stdexcept>

#include "../core/containers.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace bastion::gateway {

namespace {

// Helper for std::visit with lambdas
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

bool path_matches(const Rule& rule, std::string_view path) {
    if (rule.match == PathMatch::Exact) {
        return path == rule.path;
    }
    return core::path_has_prefix(path, rule.path);
}

}  // namespace

std::string_view to_string(Effect effect) noexcept {
    return effect == Effect::Allow ? "allow" : "deny";
}

bool Rule::matches(http::Method method, std::string_view request_path,
                   const core::Claims& claims) const {
    if (!methods.empty() && std::find(methods.begin(), methods.end(), method) == methods.end()) {
        return false;
    }

    if (!path_matches(*this, request_path)) {
        return false;
    }

    return std::visit(
        overloaded{
            [](const AnyAuthenticated&) { return true; },
            [&claims](const UsernameEquals& p) {
                // Identity rules look at the username only
                return claims.username().has_value() && *claims.username() == p.username;
            },
            [&claims](const RoleContains& p) { return claims.has_role(p.role); },
        },
        principal);
}

// PolicyEngine implementation

PolicyEngine::PolicyEngine(std::vector<Rule> rules) {
    auto errors = validate(rules);
    if (!errors.empty()) {
        throw std::invalid_argument("invalid policy: " + core::join(errors, "; "));
    }
    for (auto& rule : rules) {
        if (rule.match == PathMatch::Prefix) {
            rule.path = core::normalize_prefix(rule.path);
        }
    }
    rules_.store(std::make_shared<const RuleList>(std::move(rules)), std::memory_order_release);
}

Decision PolicyEngine::decide(http::Method method, std::string_view path,
                              const core::Claims* claims) const {
    // Unauthenticated requests never reach a rule
    if (claims == nullptr) {
        return Decision{};
    }

    auto rules = rules_.load(std::memory_order_acquire);
    for (const auto& rule : *rules) {
        if (rule.matches(method, path, *claims)) {
            return Decision{rule.effect, rule.id};
        }
    }

    return Decision{};
}

bool PolicyEngine::reload(std::vector<Rule> rules) {
    auto errors = validate(rules);
    if (!errors.empty()) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "Policy reload rejected, keeping current rules: {}",
                      core::join(errors, "; "));
        }
        return false;
    }

    for (auto& rule : rules) {
        if (rule.match == PathMatch::Prefix) {
            rule.path = core::normalize_prefix(rule.path);
        }
    }

    size_t count = rules.size();
    rules_.store(std::make_shared<const RuleList>(std::move(rules)), std::memory_order_release);

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Policy reloaded: {} rules", count);
    }
    return true;
}

size_t PolicyEngine::size() const {
    return rules_.load(std::memory_order_acquire)->size();
}

std::vector<std::string> PolicyEngine::validate(const std::vector<Rule>& rules) {
    std::vector<std::string> errors;
    if (rules.empty()) {
        errors.emplace_back("rule list is empty");
        return errors;
    }

    core::string_set ids;
    for (const auto& rule : rules) {
        if (rule.id.empty()) {
            errors.push_back("rule for path '" + rule.path + "' has no id");
        } else if (!ids.insert(rule.id).second) {
            errors.push_back("duplicate rule id '" + rule.id + "'");
        }

        if (rule.path.empty() || rule.path.front() != '/') {
            errors.push_back("rule '" + rule.id + "' path must start with '/'");
        }

        if (std::find(rule.methods.begin(), rule.methods.end(), http::Method::UNKNOWN) !=
            rule.methods.end()) {
            errors.push_back("rule '" + rule.id + "' has an unknown method");
        }

        bool empty_literal = std::visit(
            overloaded{
                [](const AnyAuthenticated&) { return false; },
                [](const UsernameEquals& p) { return p.username.empty(); },
                [](const RoleContains& p) { return p.role.empty(); },
            },
            rule.principal);
        if (empty_literal) {
            errors.push_back("rule '" + rule.id + "' has an empty principal value");
        }
    }
    return errors;
}

}  // namespace bastion::gateway
