#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string_view>

// Forward declaration to avoid circular dependency
namespace sluice::control {
struct LogConfig;
}

namespace sluice::logging {

// Start the Quill backend thread (called once at startup)
void init_logging_system();

// Create the process-wide gateway logger from config (rotating file or console)
quill::Logger* init_logger(const sluice::control::LogConfig& config);

// Shutdown logging system (called at exit, flushes pending records)
void shutdown_logging();

// Process-wide gateway logger. Bridge tasks, publishers and HTTP workers all
// run on different threads, so unlike a per-worker logger this is shared.
// Falls back to a console logger if init_logger() was never called.
quill::Logger* get_logger();

// Parse "debug" / "info" / "warning" / "error" (case-insensitive), Info on unknown
quill::LogLevel parse_log_level(std::string_view level);

// Structured logging macros

// Session lifecycle event (created, streaming, closing, closed, attach, detach)
#define LOG_SESSION(logger, event, session_id, backend, detail)                             \
    LOG_INFO(logger, "Session {}: session_id={}, backend={}, detail={}", event, session_id, \
             backend, detail)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, session_id, error_code, error_detail)           \
    LOG_ERROR(logger, "{}: session_id={}, error_code={}, error_detail={}", message, \
              session_id, error_code, error_detail)

// Backend I/O event logging
#define LOG_BACKEND(logger, event, backend, detail) \
    LOG_INFO(logger, "Backend {}: backend={}, detail={}", event, backend, detail)

}  // namespace sluice::logging
