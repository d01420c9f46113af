#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
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
// output == "stdout" logs to the console, otherwise <output>/<name>.log (rotating)
quill::Logger* init_logger(const bastion::control::LogConfig& config,
                           std::string_view name = "bastion");

// Shutdown logging system (called at exit)
void shutdown_logging();

// Get the process logger (returns nullptr if not initialized)
quill::Logger* get_logger();

// UUID v4 based correlation ID: {uuid}#{counter}
std::string generate_correlation_id();

// Validate correlation ID format produced by generate_correlation_id()
bool is_valid_correlation_id(std::string_view id);

// Logging macros for structured logging

// Security event (failed login, lockout, rejected token, ...)
// Never pass secret material (password, token, TOTP seed, backup code) as an argument.
#define LOG_SECURITY(logger, event, identifier, reason)                                   \
    LOG_WARNING(logger, "Security event: event={}, identifier={}, reason={}", event,      \
                identifier, reason)

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, client_ip, correlation_id) \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, "                         \
             "duration_us={}, client_ip={}, correlation_id={}",                           \
             method, path, status, duration_us, client_ip, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

}  // namespace bastion::logging
