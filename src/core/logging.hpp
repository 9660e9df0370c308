#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/JsonConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace bastion::control {
struct LogConfig;
}

namespace bastion::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Initialize the process logger with config-driven settings
// output "-" logs to the console, anything else is a directory for bastion.log
quill::Logger* init_logger(const bastion::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Correlation ID: per-thread UUID v4 base plus a counter ({uuid}#{n})
std::string generate_correlation_id();

// Get the process logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

// Logging macros for structured logging

// Authentication / authorization outcome (audit records are written separately)
#define LOG_DECISION(logger, decision, method, path, status, user, correlation_id)         \
  LOG_DEBUG(logger,                                                                         \
            "Decision: decision={}, method={}, path={}, status={}, user={}, "              \
            "correlation_id={}",                                                            \
            decision, method, path, status, user, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail) \
  LOG_ERROR(logger,                                                              \
            "{}: correlation_id={}, error_code={}, error_detail={}", message,    \
            correlation_id, error_code, error_detail)

// Upstream connection event logging
#define LOG_UPSTREAM(logger, event, backend, backend_host, backend_port, correlation_id) \
  LOG_INFO(logger, "Upstream {}: backend={}, address={}:{}, correlation_id={}", event,   \
           backend, backend_host, backend_port, correlation_id)

}  // namespace bastion::logging
