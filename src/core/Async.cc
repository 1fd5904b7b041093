#include "chronicle/core/Async.hh"
#include "chronicle/core/Log.hh"

#include <csignal>
#include <optional>

namespace chronicle::async {

static asio::io_context io_ctx;
static std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard;

asio::io_context& context() {
    return io_ctx;
}

void init() {
    io_ctx.restart();
    work_guard.emplace(asio::make_work_guard(io_ctx));
    CHRONICLE_LOG_DEBUG("Async: subsystem initialized");
}

void shutdown() {
    CHRONICLE_LOG_DEBUG("Async: subsystem shutting down");
    work_guard.reset();
    io_ctx.restart();
    io_ctx.run();
}

void run() {
    io_ctx.run();
}

void stop() {
    work_guard.reset();
    io_ctx.stop();
}

asio::steady_timer makeTimer() {
    return asio::steady_timer(io_ctx);
}

asio::steady_timer makeTimer(std::chrono::steady_clock::duration duration) {
    return asio::steady_timer(io_ctx, duration);
}

asio::signal_set makeTerminationSignals() {
    return asio::signal_set(io_ctx, SIGINT, SIGTERM);
}

} // namespace chronicle::async
