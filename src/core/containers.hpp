#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include <ankerl/unordered_dense.h>

namespace bastion::core {

// Container aliases over ankerl::unordered_dense.
//
// Key characteristics:
// - Dense storage: contiguous key-value pairs, iteration follows insertion order
// - Iterator invalidation: like std::vector (invalidates on insertion)
//
// Snapshots built from these containers are never mutated after publication,
// so the iterator rule only matters while a snapshot is being assembled.
//
// Usage:
//   bastion::core::fast_map<std::string, KeyEntry> keys;
//   bastion::core::string_map<Route> routes;  // find() accepts std::string_view
//   bastion::core::fast_set<std::string> roles;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

/// Transparent string hash: lookups by std::string_view without a temporary std::string
struct string_hash {
    using is_transparent = void;
    using is_avalanching = void;

    [[nodiscard]] uint64_t operator()(std::string_view value) const noexcept {
        return ankerl::unordered_dense::hash<std::string_view>{}(value);
    }
};

template <typename Value>
using string_map = ankerl::unordered_dense::map<std::string, Value, string_hash, std::equal_to<>>;

using string_set = ankerl::unordered_dense::set<std::string, string_hash, std::equal_to<>>;

}  // namespace bastion::core
