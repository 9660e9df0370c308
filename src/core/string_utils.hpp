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

// String Utilities - Path prefixes, splitting and "did you mean" suggestions

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace bastion::core {

/// Calculate Levenshtein distance between two strings
/// Used for "did you mean" hints in configuration errors
[[nodiscard]] inline size_t levenshtein_distance(std::string_view s1, std::string_view s2) {
    const size_t len1 = s1.length();
    const size_t len2 = s2.length();

    if (len1 == 0)
        return len2;
    if (len2 == 0)
        return len1;

    // Two rows instead of the full matrix
    std::vector<size_t> prev_row(len2 + 1);
    std::vector<size_t> curr_row(len2 + 1);

    for (size_t j = 0; j <= len2; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= len1; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= len2; ++j) {
            if (s1[i - 1] == s2[j - 1]) {
                curr_row[j] = prev_row[j - 1];
            } else {
                curr_row[j] = 1 + std::min({prev_row[j], curr_row[j - 1], prev_row[j - 1]});
            }
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[len2];
}

/// Closest candidate within max_distance edits (empty when nothing is close)
[[nodiscard]] inline std::string closest_match(std::string_view target,
                                               const std::vector<std::string>& candidates,
                                               size_t max_distance = 3) {
    std::string best;
    size_t best_distance = max_distance + 1;

    for (const auto& candidate : candidates) {
        size_t distance = levenshtein_distance(target, candidate);
        if (distance > 0 && distance < best_distance) {
            best = candidate;
            best_distance = distance;
        }
    }

    return best;
}

/// Join strings with a delimiter
template <typename Range>
[[nodiscard]] inline std::string join(const Range& strings, std::string_view delimiter) {
    std::string result;
    bool first = true;
    for (const auto& s : strings) {
        if (!first) {
            result += delimiter;
        }
        result += s;
        first = false;
    }
    return result;
}

/// Split on a single character, dropping empty pieces
[[nodiscard]] inline std::vector<std::string_view> split(std::string_view input, char separator) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (start <= input.size()) {
        size_t end = input.find(separator, start);
        if (end == std::string_view::npos) {
            end = input.size();
        }
        if (end > start) {
            parts.push_back(input.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

/// Case-insensitive ASCII comparison
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
               return std::tolower(static_cast<unsigned char>(ca)) ==
                      std::tolower(static_cast<unsigned char>(cb));
           });
}

/// Lower-case ASCII copy
[[nodiscard]] inline std::string to_lower(std::string_view input) {
    std::string result(input);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/// Canonical form of a configured path prefix: leading '/', no trailing '/'
/// ("/" stays "/")
[[nodiscard]] inline std::string normalize_prefix(std::string_view prefix) {
    std::string result(prefix);
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

/// Segment-aware prefix test: "/alice" covers "/alice", "/alice/" and "/alice/x"
/// but not "/alicex". The prefix must already be normalized.
[[nodiscard]] inline bool path_has_prefix(std::string_view path, std::string_view prefix) noexcept {
    if (prefix == "/") {
        return !path.empty() && path.front() == '/';
    }
    if (path.size() < prefix.size() || path.substr(0, prefix.size()) != prefix) {
        return false;
    }
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

}  // namespace bastion::core
