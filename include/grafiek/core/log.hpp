#pragma once

/// @file log.hpp
/// @brief Logging utilities for grafiek

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define GRAFIEK_LOG_TRACE(...) ::grafiek_core::engine_logger()->trace(__VA_ARGS__)
#define GRAFIEK_LOG_DEBUG(...) ::grafiek_core::engine_logger()->debug(__VA_ARGS__)
#define GRAFIEK_LOG_INFO(...) ::grafiek_core::engine_logger()->info(__VA_ARGS__)
#define GRAFIEK_LOG_WARN(...) ::grafiek_core::engine_logger()->warn(__VA_ARGS__)
#define GRAFIEK_LOG_ERROR(...) ::grafiek_core::engine_logger()->error(__VA_ARGS__)
#define GRAFIEK_LOG_CRITICAL(...) ::grafiek_core::engine_logger()->critical(__VA_ARGS__)

namespace grafiek_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
///
/// With file logging on, all loggers share one rotating file, grafiek.log,
/// in log_directory.
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Rebuild the shared sinks and apply the level to every logger
void configure_logging(const LogConfig& config);

/// Route every grafiek logger to @p sink as well (editor consoles, tests)
void add_log_sink(spdlog::sink_ptr sink);
void remove_log_sink(const spdlog::sink_ptr& sink);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the engine logger (graph mutation and execution)
std::shared_ptr<spdlog::logger> engine_logger();

/// Get the GPU logger (backends and texture pool)
std::shared_ptr<spdlog::logger> gpu_logger();

/// Get the history logger (undo/redo)
std::shared_ptr<spdlog::logger> history_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "grafiek");
    ~LogScope();

    // Non-copyable, non-movable
    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

/// Macro for easy scope logging
#define GRAFIEK_LOG_SCOPE(name) ::grafiek_core::LogScope _log_scope_##__LINE__(name)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace grafiek_core
