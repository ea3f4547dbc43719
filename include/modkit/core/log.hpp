#pragma once

/// @file log.hpp
/// @brief Logging utilities for modkit

#include <spdlog/spdlog.h>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define MODKIT_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define MODKIT_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define MODKIT_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define MODKIT_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define MODKIT_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define MODKIT_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace modkit_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the logging system (basic)
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Subsystem Loggers
// =============================================================================

/// Names of the loggers each subsystem writes to
namespace log_names {
constexpr const char* MODS = "mods";
constexpr const char* PATCHES = "patches";
constexpr const char* CONTENT = "content";
} // namespace log_names

/// Get or create a named logger with the configured sinks and level
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Discovery, resolution and the mod loader
std::shared_ptr<spdlog::logger> mod_logger();

/// The patch applicator and patch file loading
std::shared_ptr<spdlog::logger> patch_logger();

/// Base content loading into the document store
std::shared_ptr<spdlog::logger> content_logger();

/// Parse a level name ("trace" .. "critical", "off")
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log entry with structured data
///
/// Emits `message {key="value", ...}` on the named logger.
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = log_names::MODS);
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

#define MODKIT_LOG_CONCAT_INNER(a, b) a##b
#define MODKIT_LOG_CONCAT(a, b) MODKIT_LOG_CONCAT_INNER(a, b)

/// Trace entry and exit of the enclosing block on the mods logger
#define MODKIT_LOG_SCOPE(name) ::modkit_core::LogScope MODKIT_LOG_CONCAT(modkit_log_scope_, __LINE__)(name)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush and drop every subsystem logger
void shutdown_logging();

} // namespace modkit_core
