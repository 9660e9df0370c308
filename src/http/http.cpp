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

// Bastion HTTP Protocol - Implementation

#include "http.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace bastion::http {

namespace {

const Header* find_in(const std::vector<Header>& headers, std::string_view name) noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.first, name)) {
            return &header;
        }
    }
    return nullptr;
}

void set_in(std::vector<Header>& headers, std::string_view name, std::string_view value) {
    auto it = std::find_if(headers.begin(), headers.end(), [name](const Header& header) {
        return header_name_equals(header.first, name);
    });

    if (it == headers.end()) {
        headers.emplace_back(std::string(name), std::string(value));
        return;
    }

    it->second = std::string(value);

    // Drop any duplicates so the header has exactly one value
    headers.erase(std::remove_if(std::next(it), headers.end(),
                                 [name](const Header& header) {
                                     return header_name_equals(header.first, name);
                                 }),
                  headers.end());
}

size_t remove_from(std::vector<Header>& headers, std::string_view name) {
    auto before = headers.size();
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [name](const Header& header) {
                                     return header_name_equals(header.first, name);
                                 }),
                  headers.end());
    return before - headers.size();
}

}  // namespace

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view(header->second) : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

void Request::set_header(std::string_view name, std::string_view value) {
    set_in(headers, name, value);
}

size_t Request::remove_header(std::string_view name) {
    return remove_from(headers, name);
}

std::string Request::target() const {
    if (query.empty()) {
        return path;
    }
    return path + "?" + query;
}

// Response helper methods

const Header* Response::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view(header->second) : default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

void Response::set_header(std::string_view name, std::string_view value) {
    set_in(headers, name, value);
}

size_t Response::remove_header(std::string_view name) {
    return remove_from(headers, name);
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (str == "GET")
        return Method::GET;
    if (str == "POST")
        return Method::POST;
    if (str == "PUT")
        return Method::PUT;
    if (str == "DELETE")
        return Method::DELETE;
    if (str == "HEAD")
        return Method::HEAD;
    if (str == "OPTIONS")
        return Method::OPTIONS;
    if (str == "PATCH")
        return Method::PATCH;
    if (str == "CONNECT")
        return Method::CONNECT;
    if (str == "TRACE")
        return Method::TRACE;
    return Method::UNKNOWN;
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::NoContent:
            return "No Content";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::Forbidden:
            return "Forbidden";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::PayloadTooLarge:
            return "Payload Too Large";
        case StatusCode::ClientClosedRequest:
            return "Client Closed Request";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::BadGateway:
            return "Bad Gateway";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
        case StatusCode::GatewayTimeout:
            return "Gateway Timeout";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

bool is_hop_by_hop_header(std::string_view name) noexcept {
    static constexpr std::array<std::string_view, 9> hop_by_hop = {
        "Connection",          "Keep-Alive", "Proxy-Authenticate",
        "Proxy-Authorization", "TE",         "Trailer",
        "Transfer-Encoding",   "Upgrade",    "Proxy-Connection"};

    return std::any_of(hop_by_hop.begin(), hop_by_hop.end(),
                       [name](std::string_view h) { return header_name_equals(h, name); });
}

bool is_idempotent(Method method) noexcept {
    switch (method) {
        case Method::GET:
        case Method::HEAD:
        case Method::OPTIONS:
        case Method::PUT:
        case Method::DELETE:
        case Method::TRACE:
            return true;
        default:
            return false;
    }
}

}  // namespace bastion::http
