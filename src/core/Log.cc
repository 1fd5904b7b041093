#include "chronicle/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <string>
#include <vector>

namespace chronicle::log {

namespace {
// Root logger (all channels aggregated)
quill::Logger* g_logger = nullptr;

// Per-channel named loggers
quill::Logger* g_logger_parser = nullptr;
quill::Logger* g_logger_timeline = nullptr;
quill::Logger* g_logger_store = nullptr;

std::shared_ptr<quill::Sink> makeFileSink(const std::string& filename) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(filename, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        return cfg;
    }());
}

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(logger:<8) %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void createLoggers(const std::vector<std::shared_ptr<quill::Sink>>& sinks) {
    auto pattern = makePattern();

    g_logger = quill::Frontend::create_or_get_logger("chronicle", sinks, pattern);
    g_logger_parser = quill::Frontend::create_or_get_logger("parser", sinks, pattern);
    g_logger_timeline = quill::Frontend::create_or_get_logger("timeline", sinks, pattern);
    g_logger_store = quill::Frontend::create_or_get_logger("store", sinks, pattern);

    for (auto* lg : {g_logger, g_logger_parser, g_logger_timeline, g_logger_store}) {
        lg->set_log_level(quill::LogLevel::Info);
    }
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "ChronicleLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;

    quill::Backend::start(backend_opts);
}

} // namespace

void init() {
    startBackend();

    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    createLoggers({console_sink});
}

void init(const char* log_file_path) {
    startBackend();

    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto file_sink = makeFileSink(log_file_path);
    createLoggers({console_sink, file_sink});
}

void shutdown() {
    for (auto* lg : {g_logger, g_logger_parser, g_logger_timeline, g_logger_store}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    return g_logger;
}

quill::Logger* parserLogger() {
    return g_logger_parser;
}

quill::Logger* timelineLogger() {
    return g_logger_timeline;
}

quill::Logger* storeLogger() {
    return g_logger_store;
}

void setLevel(quill::LogLevel level) {
    if (g_logger) {
        g_logger->set_log_level(level);
    }
}

void setParserLevel(quill::LogLevel level) {
    if (g_logger_parser)
        g_logger_parser->set_log_level(level);
}

void setTimelineLevel(quill::LogLevel level) {
    if (g_logger_timeline)
        g_logger_timeline->set_log_level(level);
}

void setStoreLevel(quill::LogLevel level) {
    if (g_logger_store)
        g_logger_store->set_log_level(level);
}

std::optional<quill::LogLevel> levelFromString(std::string_view name) {
    if (name == "trace")
        return quill::LogLevel::TraceL1;
    if (name == "debug")
        return quill::LogLevel::Debug;
    if (name == "info")
        return quill::LogLevel::Info;
    if (name == "warning" || name == "warn")
        return quill::LogLevel::Warning;
    if (name == "error")
        return quill::LogLevel::Error;
    if (name == "critical")
        return quill::LogLevel::Critical;
    return std::nullopt;
}

} // namespace chronicle::log
