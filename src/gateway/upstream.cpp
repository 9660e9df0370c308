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

// Bastion Upstream - Implementation

#include "upstream.hpp"

#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "../core/logging.hpp"

namespace bastion::gateway {

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(10);

bool is_cancelled(const CancelCheck& cancelled) {
    return cancelled && cancelled();
}

// Headers httplib computes itself
bool is_framing_header(std::string_view name) noexcept {
    return http::header_name_equals(name, "Host") ||
           http::header_name_equals(name, "Content-Length");
}

/// Aborts a blocking httplib call once the client goes away or the attempt
/// runs past its deadline. httplib's own read timeout only bounds each recv().
class CallWatchdog {
public:
    enum class Trip : uint8_t { None, Cancelled, Deadline };

    CallWatchdog(httplib::Client& client, const CancelCheck& cancelled,
                 std::chrono::steady_clock::time_point deadline)
        : client_(client), cancelled_(cancelled), deadline_(deadline), thread_([this] { run(); }) {}

    ~CallWatchdog() { finish(); }

    // Non-copyable, non-movable
    CallWatchdog(const CallWatchdog&) = delete;
    CallWatchdog& operator=(const CallWatchdog&) = delete;
    CallWatchdog(CallWatchdog&&) = delete;
    CallWatchdog& operator=(CallWatchdog&&) = delete;

    /// The call returned: stop watching and join
    void finish() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_one();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] Trip tripped() const noexcept { return trip_.load(); }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!done_) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline_) {
                trip(Trip::Deadline);
                return;
            }
            if (is_cancelled(cancelled_)) {
                trip(Trip::Cancelled);
                return;
            }
            auto wake = cancelled_ ? std::min(deadline_, now + kCancelPollInterval) : deadline_;
            cv_.wait_until(lock, wake);
        }
    }

    void trip(Trip reason) {
        trip_.store(reason);
        client_.stop();  // Shuts the socket down; the blocked call returns with an error
    }

    httplib::Client& client_;
    const CancelCheck& cancelled_;
    const std::chrono::steady_clock::time_point deadline_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    std::atomic<Trip> trip_{Trip::None};

    std::thread thread_;  // Started last, after every member it reads
};

}  // namespace

// HttpBackendClient implementation

UpstreamResult HttpBackendClient::send(const Backend& backend, const http::Request& request,
                                       const CancelCheck& cancelled) {
    if (is_cancelled(cancelled)) {
        return UpstreamResult::failure(UpstreamError::Cancelled);
    }

    httplib::Client client(backend.host, backend.port);
    client.set_connection_timeout(backend.connect_timeout);
    client.set_read_timeout(backend.read_timeout);
    client.set_write_timeout(backend.read_timeout);
    client.set_keep_alive(false);

    httplib::Request req;
    req.method = std::string(http::to_string(request.method));
    req.path = request.target();
    req.body = request.body;
    for (const auto& [name, value] : request.headers) {
        if (http::is_hop_by_hop_header(name) || is_framing_header(name)) {
            continue;
        }
        req.headers.emplace(name, value);
    }

    // Checked between response chunks as well as by the watchdog
    std::string body;
    req.response_handler = [&cancelled](const httplib::Response&) {
        return !is_cancelled(cancelled);
    };
    req.content_receiver = [&body, &cancelled](const char* data, size_t length, uint64_t,
                                               uint64_t) {
        body.append(data, length);
        return !is_cancelled(cancelled);
    };

    CallWatchdog watchdog(client, cancelled,
                          std::chrono::steady_clock::now() + backend.read_timeout);
    auto result = client.send(req);
    watchdog.finish();

    if (!result) {
        auto error = result.error();
        if (watchdog.tripped() == CallWatchdog::Trip::Cancelled ||
            error == httplib::Error::Canceled || is_cancelled(cancelled)) {
            return UpstreamResult::failure(UpstreamError::Cancelled);
        }
        if (watchdog.tripped() == CallWatchdog::Trip::Deadline) {
            return UpstreamResult::failure(UpstreamError::Timeout);
        }

        // Refused, reset or dropped before the deadline
        auto* logger = logging::get_current_logger();
        if (logger) {
            LOG_DEBUG(logger, "Backend {} at {}:{} failed: {}", backend.name, backend.host,
                      backend.port, httplib::to_string(error));
        }
        return UpstreamResult::failure(UpstreamError::Unreachable);
    }

    if (result->status < 100 || result->status > 599) {
        return UpstreamResult::failure(UpstreamError::BadResponse);
    }

    http::Response response;
    response.status = static_cast<http::StatusCode>(result->status);
    response.body = std::move(body);
    for (const auto& [name, value] : result->headers) {
        if (http::is_hop_by_hop_header(name) || http::header_name_equals(name, "Content-Length")) {
            continue;
        }
        response.headers.emplace_back(name, value);
    }

    return UpstreamResult::success(std::move(response));
}

UpstreamResult forward_with_retries(BackendClient& client, const Backend& backend,
                                    const http::Request& request, const CancelCheck& cancelled) {
    const uint32_t max_attempts =
        http::is_idempotent(request.method) ? backend.max_retries + 1 : 1;

    UpstreamResult result;
    uint32_t attempts = 0;
    while (attempts < max_attempts) {
        if (attempts > 0 && is_cancelled(cancelled)) {
            result = UpstreamResult::failure(UpstreamError::Cancelled);
            break;
        }

        result = client.send(backend, request, cancelled);
        ++attempts;

        bool retryable =
            result.error == UpstreamError::Unreachable || result.error == UpstreamError::Timeout;
        if (!retryable) {
            break;
        }

        if (attempts < max_attempts) {
            auto* logger = logging::get_current_logger();
            if (logger) {
                LOG_WARNING(logger, "Retrying {} {} on backend {} (attempt {} of {}): {}",
                            http::to_string(request.method), request.path, backend.name,
                            attempts + 1, max_attempts, to_reason(result.error));
            }
        }
    }

    result.attempts = attempts;
    return result;
}

http::StatusCode to_status(UpstreamError error) noexcept {
    switch (error) {
        case UpstreamError::Timeout:
            return http::StatusCode::GatewayTimeout;
        case UpstreamError::Cancelled:
            return http::StatusCode::ClientClosedRequest;
        case UpstreamError::None:
            return http::StatusCode::OK;
        case UpstreamError::Unreachable:
        case UpstreamError::BadResponse:
            return http::StatusCode::BadGateway;
    }
    return http::StatusCode::BadGateway;
}

std::string_view to_reason(UpstreamError error) noexcept {
    switch (error) {
        case UpstreamError::None:
            return "";
        case UpstreamError::Unreachable:
            return "upstream_unreachable";
        case UpstreamError::Timeout:
            return "upstream_timeout";
        case UpstreamError::Cancelled:
            return "client_cancelled";
        case UpstreamError::BadResponse:
            return "upstream_bad_response";
    }
    return "upstream_unreachable";
}

}  // namespace bastion::gateway
