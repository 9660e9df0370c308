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

// Bastion Audit Logger - Header
// One JSON access record per request, written through a dedicated sink

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quill {
class Logger;
}

namespace bastion::gateway {

enum class AuditDecision : uint8_t { Allow, Deny, Unauthenticated };

/// Access record (never carries the token or any part of it)
struct AccessRecord {
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::string request_id;
    std::string method;
    std::string path;
    uint16_t status = 500;
    AuditDecision decision = AuditDecision::Deny;
    std::optional<std::string> reason;
    std::optional<std::string> rule_id;
    std::optional<std::string> subject;
    std::optional<std::string> username;
    std::vector<std::string> roles;
    std::optional<std::string> backend;
    double latency_ms = 0.0;
};

void to_json(nlohmann::json& j, const AccessRecord& record);

[[nodiscard]] std::string_view to_string(AuditDecision decision) noexcept;

/// RFC 3339 UTC with millisecond precision (2025-01-31T12:00:00.123Z)
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point tp);

/// Where serialized records go (one call per line, no trailing newline)
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void write(std::string_view line) = 0;
};

/// Sink backed by a dedicated quill logger with a message-only pattern
class QuillAuditSink : public AuditSink {
public:
    /// "stdout" or "file" (path required for file)
    QuillAuditSink(std::string_view sink, std::string_view path);

    void write(std::string_view line) override;

private:
    quill::Logger* logger_ = nullptr;
};

/// Audit logger
class AuditLogger {
public:
    explicit AuditLogger(std::shared_ptr<AuditSink> sink);

    // Non-copyable, non-movable
    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    /// Serialize and hand one record to the sink
    void record(const AccessRecord& record);

    /// Serialized form of a record (single line JSON)
    [[nodiscard]] static std::string serialize(const AccessRecord& record);

private:
    std::shared_ptr<AuditSink> sink_;
};

/// Records exactly one access record per request.
/// commit() writes it; if nothing committed before destruction (a stage threw),
/// the record is written as 500 internal_error.
class AuditScope {
public:
    AuditScope(AuditLogger& logger, AccessRecord record);
    ~AuditScope();

    // Non-copyable, non-movable
    AuditScope(const AuditScope&) = delete;
    AuditScope& operator=(const AuditScope&) = delete;
    AuditScope(AuditScope&&) = delete;
    AuditScope& operator=(AuditScope&&) = delete;

    /// Record under construction
    [[nodiscard]] AccessRecord& record() noexcept { return record_; }

    /// Stamp latency and write the record (no-op after the first call)
    void commit();

    [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
    AuditLogger& logger_;
    AccessRecord record_;
    std::chrono::steady_clock::time_point start_;
    bool committed_ = false;
};

}  // namespace bastion::gateway
