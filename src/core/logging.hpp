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
namespace lattice::control {
struct LogConfig;
}

namespace lattice::logging {

// Start the Quill backend thread (idempotent)
void init_logging_system();

// Create the process logger for a component with config-driven sinks and level.
// output == "stdout" logs to the console, anything else is a directory that
// receives <component>.log.
quill::Logger* init_logger(std::string_view component, const lattice::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Process logger. Falls back to a console logger when init_logger was never called.
quill::Logger* get_current_logger();

// Map a level name ("debug", "info", "warning"/"warn", "error") to a Quill level
quill::LogLevel parse_log_level(std::string_view level);

// Per-object problem, reported with the object's identity
#define LOG_OBJECT_ERROR(logger, kind, ns, name, message) \
    LOG_WARNING(logger, "{}: kind={}, namespace={}, name={}", message, kind, ns, name)

// Rebuild completion
#define LOG_REBUILD(logger, sequence, outstanding, duration_us)                               \
    LOG_INFO(logger, "Rebuild completed: sequence={}, outstanding_events={}, duration_us={}", \
             sequence, outstanding, duration_us)

}  // namespace lattice::logging
