#pragma once

// Chronicle Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "chronicle/core/Log.hh"
//   CHRONICLE_LOG_INFO("Imported {} snapshots", count);
//   CHRONICLE_TIMELINE_LOG_WARN("{} skipped: dependency {} has no output", id, dep);

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

#include <optional>
#include <string_view>

namespace chronicle::log {

/// Initialize the logging subsystem (console output only).
/// Call once at startup before any logging.
void init();

/// Initialize with file sink in addition to console.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Get the root logger. Valid after init().
quill::Logger* logger();

/// Channel loggers. Valid after init().
quill::Logger* parserLogger();
quill::Logger* timelineLogger();
quill::Logger* storeLogger();

/// Set runtime log level (within compile-time ceiling).
void setLevel(quill::LogLevel level);
void setParserLevel(quill::LogLevel level);
void setTimelineLevel(quill::LogLevel level);
void setStoreLevel(quill::LogLevel level);

/// Parses "trace", "debug", "info", "warning"/"warn", "error", "critical".
std::optional<quill::LogLevel> levelFromString(std::string_view name);

} // namespace chronicle::log

// Chronicle logging macros - wrap Quill with the root logger.
// Compile-time filtering: in Release builds, DEBUG and TRACE are absent.
#define CHRONICLE_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(chronicle::log::logger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(chronicle::log::logger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_LOG_INFO(fmt, ...) QUILL_LOG_INFO(chronicle::log::logger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(chronicle::log::logger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(chronicle::log::logger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(chronicle::log::logger(), fmt, ##__VA_ARGS__)

// Channel macros
#define CHRONICLE_PARSER_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(chronicle::log::parserLogger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_PARSER_LOG_INFO(fmt, ...) QUILL_LOG_INFO(chronicle::log::parserLogger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_PARSER_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(chronicle::log::parserLogger(), fmt, ##__VA_ARGS__)

#define CHRONICLE_TIMELINE_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(chronicle::log::timelineLogger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_TIMELINE_LOG_INFO(fmt, ...) QUILL_LOG_INFO(chronicle::log::timelineLogger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_TIMELINE_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(chronicle::log::timelineLogger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_TIMELINE_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(chronicle::log::timelineLogger(), fmt, ##__VA_ARGS__)

#define CHRONICLE_STORE_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(chronicle::log::storeLogger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_STORE_LOG_INFO(fmt, ...) QUILL_LOG_INFO(chronicle::log::storeLogger(), fmt, ##__VA_ARGS__)
#define CHRONICLE_STORE_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(chronicle::log::storeLogger(), fmt, ##__VA_ARGS__)
