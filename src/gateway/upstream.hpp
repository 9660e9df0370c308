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

// Bastion Upstream - Header
// Backend calls with timeouts, cancellation and idempotent-only retries

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "../http/http.hpp"

namespace bastion::gateway {

/// Backend server definition
struct Backend {
    std::string name;
    std::string host;
    uint16_t port = 80;

    std::chrono::milliseconds connect_timeout{2000};
    std::chrono::milliseconds read_timeout{30000};  // Whole attempt, response body included
    uint32_t max_retries = 1;  // Extra attempts for idempotent methods
};

/// Why a backend call produced no response
enum class UpstreamError : uint8_t {
    None,
    Unreachable,  // Connect failed or connection dropped
    Timeout,      // Attempt still pending after read_timeout
    Cancelled,    // Client went away
    BadResponse,  // Backend answered with something unusable
};

/// Outcome of a backend call
struct UpstreamResult {
    std::optional<http::Response> response;
    UpstreamError error = UpstreamError::None;
    uint32_t attempts = 0;

    [[nodiscard]] static UpstreamResult success(http::Response response) {
        return {std::move(response), UpstreamError::None, 1};
    }

    [[nodiscard]] static UpstreamResult failure(UpstreamError error) {
        return {std::nullopt, error, 1};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return response.has_value(); }
};

/// Returns true once the inbound client has disconnected
using CancelCheck = std::function<bool()>;

/// Performs one backend call
class BackendClient {
public:
    virtual ~BackendClient() = default;

    [[nodiscard]] virtual UpstreamResult send(const Backend& backend, const http::Request& request,
                                              const CancelCheck& cancelled) = 0;
};

/// Backend client over cpp-httplib (one connection per call)
class HttpBackendClient : public BackendClient {
public:
    [[nodiscard]] UpstreamResult send(const Backend& backend, const http::Request& request,
                                      const CancelCheck& cancelled) override;
};

/// Call the backend, retrying up to backend.max_retries times.
/// Only idempotent methods are retried, only after Unreachable or Timeout,
/// and never once the client has cancelled.
[[nodiscard]] UpstreamResult forward_with_retries(BackendClient& client, const Backend& backend,
                                                  const http::Request& request,
                                                  const CancelCheck& cancelled);

/// Status sent to the client for an upstream failure (502, 504 or 499)
[[nodiscard]] http::StatusCode to_status(UpstreamError error) noexcept;

/// Audit reason for an upstream failure
[[nodiscard]] std::string_view to_reason(UpstreamError error) noexcept;

}  // namespace bastion::gateway
