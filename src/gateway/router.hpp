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

// Bastion Router - Header
// Segment tree for longest-prefix matching with path rewriting

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"

namespace bastion::gateway {

/// Route definition
struct Route {
    std::string prefix;         // Path prefix on whole segments (e.g., "/alice")
    std::string backend;        // Backend name
    std::string rewrite = "/";  // Replacement for the matched prefix
};

/// Match result from router
struct RouteTarget {
    std::string backend;  // Backend name
    std::string path;     // Rewritten path, query string preserved
    std::string prefix;   // Matched route prefix (normalized)
};

/// Segment tree node (internal)
struct RouteNode {
    RouteNode() = default;
    ~RouteNode() = default;

    // Non-copyable, movable
    RouteNode(const RouteNode&) = delete;
    RouteNode& operator=(const RouteNode&) = delete;
    RouteNode(RouteNode&&) noexcept = default;
    RouteNode& operator=(RouteNode&&) noexcept = default;

    core::string_map<std::unique_ptr<RouteNode>> children;  // Segment -> child
    std::optional<Route> route;                             // Route ending at this node
};

/// Router over an immutable route table.
/// Lookups take one atomic load; reload() builds a new table and swaps it in.
class Router {
public:
    /// Throws std::invalid_argument when the table is invalid
    explicit Router(std::vector<Route> routes);
    ~Router() = default;

    // Non-copyable, non-movable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;
    Router(Router&&) = delete;
    Router& operator=(Router&&) = delete;

    /// Longest-prefix match for a request target ("/path?query").
    /// nullopt means NoRoute.
    [[nodiscard]] std::optional<RouteTarget> route(std::string_view target) const;

    /// Replace the table; the old one stays active when the new one is invalid
    [[nodiscard]] bool reload(std::vector<Route> routes);

    /// Number of routes in the active table
    [[nodiscard]] size_t size() const;

    /// Problems with a route table (empty when valid)
    [[nodiscard]] static std::vector<std::string> validate(const std::vector<Route>& routes);

private:
    struct Table {
        RouteNode root;
        size_t count = 0;
    };

    [[nodiscard]] static std::shared_ptr<const Table> build(std::vector<Route> routes);

    std::atomic<std::shared_ptr<const Table>> table_;
};

/// Replace the matched part of path with rewrite (no doubled '/' at the joint)
[[nodiscard]] std::string rewrite_path(std::string_view rewrite, std::string_view remainder);

}  // namespace bastion::gateway
