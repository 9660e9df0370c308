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

// Bastion Audit Logger - Implementation

#include "audit.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/core/PatternFormatterOptions.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <cstdio>
#include <ctime>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace bastion::gateway {

namespace {

nlohmann::json nullable(const std::optional<std::string>& value) {
    if (value.has_value()) {
        return *value;
    }
    return nullptr;
}

}  // namespace

std::string_view to_string(AuditDecision decision) noexcept {
    switch (decision) {
        case AuditDecision::Allow:
            return "allow";
        case AuditDecision::Deny:
            return "deny";
        case AuditDecision::Unauthenticated:
            return "unauthenticated";
    }
    return "deny";
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();

    std::time_t t = std::chrono::system_clock::to_time_t(seconds);
    std::tm utc{};
    gmtime_r(&t, &utc);

    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", utc, millis);
}

void to_json(nlohmann::json& j, const AccessRecord& record) {
    j = nlohmann::json{{"timestamp", format_timestamp(record.timestamp)},
                       {"request_id", record.request_id},
                       {"method", record.method},
                       {"path", record.path},
                       {"status", record.status},
                       {"decision", to_string(record.decision)},
                       {"reason", nullable(record.reason)},
                       {"rule_id", nullable(record.rule_id)},
                       {"subject", nullable(record.subject)},
                       {"username", nullable(record.username)},
                       {"roles", record.roles},
                       {"backend", nullable(record.backend)},
                       {"latency_ms", record.latency_ms}};
}

// QuillAuditSink implementation

QuillAuditSink::QuillAuditSink(std::string_view sink, std::string_view path) {
    // Access records are complete JSON documents: no prefix, no metadata
    quill::PatternFormatterOptions options{"%(message)"};

    if (sink == "stdout") {
        auto console = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("bastion_audit_stdout");
        logger_ = quill::Frontend::create_or_get_logger("audit", std::move(console), options);
    } else if (sink == "file") {
        if (path.empty()) {
            throw std::invalid_argument("audit file sink requires a path");
        }
        quill::FileSinkConfig config;
        config.set_open_mode('a');
        auto file = quill::Frontend::create_or_get_sink<quill::FileSink>(std::string(path), config);
        logger_ = quill::Frontend::create_or_get_logger("audit", std::move(file), options);
    } else {
        throw std::invalid_argument(fmt::format("unknown audit sink '{}'", sink));
    }
}

void QuillAuditSink::write(std::string_view line) {
    LOG_INFO(logger_, "{}", line);
}

// AuditLogger implementation

AuditLogger::AuditLogger(std::shared_ptr<AuditSink> sink) : sink_(std::move(sink)) {
    if (!sink_) {
        throw std::invalid_argument("audit sink is required");
    }
}

void AuditLogger::record(const AccessRecord& record) {
    sink_->write(serialize(record));
}

std::string AuditLogger::serialize(const AccessRecord& record) {
    nlohmann::json j = record;
    // Replace invalid UTF-8 from request paths instead of throwing
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// AuditScope implementation

AuditScope::AuditScope(AuditLogger& logger, AccessRecord record)
    : logger_(logger), record_(std::move(record)), start_(std::chrono::steady_clock::now()) {}

AuditScope::~AuditScope() {
    if (committed_) {
        return;
    }
    record_.status = 500;
    record_.reason = "internal_error";
    try {
        commit();
    } catch (const std::exception& e) {
        // Destructors must not throw; the record is lost
        fmt::print(stderr, "audit record lost: {}\n", e.what());
    }
}

void AuditScope::commit() {
    if (committed_) {
        return;
    }
    committed_ = true;
    record_.latency_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_)
            .count();
    logger_.record(record_);
}

}  // namespace bastion::gateway
