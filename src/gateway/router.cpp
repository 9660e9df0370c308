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

// Bastion Router - Implementation

#include "router.hpp"

#include <stdexcept>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace bastion::gateway {

std::string rewrite_path(std::string_view rewrite, std::string_view remainder) {
    std::string result(rewrite);
    if (remainder.empty()) {
        return result.empty() ? std::string("/") : result;
    }
    if (!result.empty() && result.back() == '/') {
        while (!remainder.empty() && remainder.front() == '/') {
            remainder.remove_prefix(1);
        }
    } else if (remainder.front() != '/') {
        result.push_back('/');
    }
    result.append(remainder);
    return result;
}

// Router implementation

Router::Router(std::vector<Route> routes) {
    auto errors = validate(routes);
    if (!errors.empty()) {
        throw std::invalid_argument("invalid route table: " + core::join(errors, "; "));
    }
    table_.store(build(std::move(routes)), std::memory_order_release);
}

std::optional<RouteTarget> Router::route(std::string_view target) const {
    std::string_view path = target;
    std::string_view query;
    if (auto pos = target.find('?'); pos != std::string_view::npos) {
        path = target.substr(0, pos);
        query = target.substr(pos);  // Keeps the '?'
    }

    if (path.empty() || path.front() != '/') {
        return std::nullopt;
    }

    auto table = table_.load(std::memory_order_acquire);

    // Walk whole segments, remembering the deepest node that ends a route
    const RouteNode* node = &table->root;
    const Route* best = node->route ? &*node->route : nullptr;
    size_t best_end = 0;

    size_t pos = 0;
    while (pos < path.size()) {
        while (pos < path.size() && path[pos] == '/') {
            ++pos;
        }
        if (pos >= path.size()) {
            break;
        }
        size_t end = path.find('/', pos);
        if (end == std::string_view::npos) {
            end = path.size();
        }

        auto it = node->children.find(path.substr(pos, end - pos));
        if (it == node->children.end()) {
            break;
        }
        node = it->second.get();
        if (node->route) {
            best = &*node->route;
            best_end = end;
        }
        pos = end;
    }

    if (best == nullptr) {
        return std::nullopt;
    }

    std::string rewritten = rewrite_path(best->rewrite, path.substr(best_end));
    rewritten.append(query);
    return RouteTarget{best->backend, std::move(rewritten), best->prefix};
}

bool Router::reload(std::vector<Route> routes) {
    auto errors = validate(routes);
    if (!errors.empty()) {
        auto* logger = logging::get_current_logger();
        if (logger) {
            LOG_ERROR(logger, "Route reload rejected, keeping current table: {}",
                      core::join(errors, "; "));
        }
        return false;
    }

    auto table = build(std::move(routes));
    size_t count = table->count;
    table_.store(std::move(table), std::memory_order_release);

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Route table reloaded: {} routes", count);
    }
    return true;
}

size_t Router::size() const {
    return table_.load(std::memory_order_acquire)->count;
}

std::vector<std::string> Router::validate(const std::vector<Route>& routes) {
    std::vector<std::string> errors;
    core::string_set seen;

    for (const auto& route : routes) {
        if (route.prefix.empty() || route.prefix.front() != '/') {
            errors.push_back("route prefix '" + route.prefix + "' must start with '/'");
            continue;
        }
        if (route.backend.empty()) {
            errors.push_back("route '" + route.prefix + "' has no backend");
        }
        if (!seen.insert(core::normalize_prefix(route.prefix)).second) {
            errors.push_back("duplicate route prefix '" + route.prefix + "'");
        }
    }
    return errors;
}

std::shared_ptr<const Router::Table> Router::build(std::vector<Route> routes) {
    auto table = std::make_shared<Table>();

    for (auto& route : routes) {
        route.prefix = core::normalize_prefix(route.prefix);
        if (route.rewrite.empty()) {
            route.rewrite = "/";
        }

        RouteNode* current = &table->root;
        for (auto segment : core::split(route.prefix, '/')) {
            auto& child = current->children[std::string(segment)];
            if (!child) {
                child = std::make_unique<RouteNode>();
            }
            current = child.get();
        }
        current->route = std::move(route);
        ++table->count;
    }

    return table;
}

}  // namespace bastion::gateway
