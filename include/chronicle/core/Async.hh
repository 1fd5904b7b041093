#pragma once

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>

namespace chronicle::async {

/// Get the process-wide io_context used by watch mode.
asio::io_context& context();

/// Initialize the async subsystem. Call once at startup.
void init();

/// Shutdown: release work guard, drain remaining handlers.
void shutdown();

/// Blocking run. Returns after stop() or when all work completes.
void run();

/// Make run() return as soon as possible. Safe to call from handlers.
void stop();

/// Create a steady_timer bound to the async context.
asio::steady_timer makeTimer();
asio::steady_timer makeTimer(std::chrono::steady_clock::duration duration);

/// SIGINT / SIGTERM set bound to the async context.
asio::signal_set makeTerminationSignals();

} // namespace chronicle::async
