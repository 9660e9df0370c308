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

// Bastion HTTP Protocol - Header
// Owned HTTP request/response value types shared by the server and backend client

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bastion::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP status codes
/// Backend responses may carry values outside this list; the enum is only a
/// name for the codes the gateway synthesizes itself.
enum class StatusCode : uint16_t {
    // 2xx Success
    OK = 200,
    NoContent = 204,

    // 4xx Client Error
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    PayloadTooLarge = 413,
    ClientClosedRequest = 499,  // nginx convention, never sent on the wire

    // 5xx Server Error
    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504,
};

/// HTTP header (name-value pair)
using Header = std::pair<std::string, std::string>;

/// HTTP request
/// Owns its data: the gateway keeps requests alive across retries and audit.
struct Request {
    Method method = Method::UNKNOWN;

    std::string path;   // Path without query string
    std::string query;  // Query string without '?' (if present)

    std::vector<Header> headers;
    std::string body;

    std::string client_ip;

    // Helper: Find header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Helper: Replace (or add) header
    void set_header(std::string_view name, std::string_view value);

    // Helper: Remove every header with this name (case-insensitive)
    // Returns number of headers removed
    size_t remove_header(std::string_view name);

    /// Path plus "?query" when a query string is present
    [[nodiscard]] std::string target() const;
};

/// HTTP response
struct Response {
    StatusCode status = StatusCode::OK;

    std::vector<Header> headers;
    std::string body;

    // Helper: Find header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Helper: Replace (or add) header
    void set_header(std::string_view name, std::string_view value);

    // Helper: Remove every header with this name (case-insensitive)
    size_t remove_header(std::string_view name);

    /// Numeric status code
    [[nodiscard]] uint16_t status_code() const noexcept { return static_cast<uint16_t>(status); }
};

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method (exact, upper case)
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// Hop-by-hop headers (RFC 9110 section 7.6.1) are never forwarded
[[nodiscard]] bool is_hop_by_hop_header(std::string_view name) noexcept;

/// Idempotent methods (RFC 9110 section 9.2.2) may be retried after a transport failure
[[nodiscard]] bool is_idempotent(Method method) noexcept;

}  // namespace bastion::http
