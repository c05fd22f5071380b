#pragma once

/// @file log.hpp
/// @brief Logging for pyembed
///
/// Every pyembed library logs through a named spdlog logger ("channel"). All
/// channels share one sink set: stderr, plus an optional log file. Levels are
/// global with optional per-channel overrides that also apply to channels
/// created later.

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// =============================================================================
// Logging Macros
// =============================================================================

#define PYEMBED_PACKAGING_TRACE(...) ::pyembed_core::packaging_logger()->trace(__VA_ARGS__)
#define PYEMBED_PACKAGING_DEBUG(...) ::pyembed_core::packaging_logger()->debug(__VA_ARGS__)
#define PYEMBED_PACKAGING_WARN(...) ::pyembed_core::packaging_logger()->warn(__VA_ARGS__)

namespace pyembed_core {

/// Built-in logging channels
enum class LogChannel {
    Core,
    Packaging,
};

/// Logger name of a channel ("pyembed_core", "pyembed_packaging")
[[nodiscard]] const char* log_channel_name(LogChannel channel) noexcept;

// =============================================================================
// Configuration
// =============================================================================

/// Logging configuration
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console = true;
    bool color = true;
    /// Also append to this file when set
    std::optional<std::filesystem::path> log_file;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
};

/// Rebuild the shared sinks and apply the level to every existing channel.
///
/// A log file that cannot be opened is reported on stderr and skipped.
/// Replaces the sink list of live loggers, which spdlog does not guard: call it
/// only while no other thread is logging.
void configure_logging(const LogConfig& config);

/// Configuration currently in effect
[[nodiscard]] LogConfig current_log_config();

// =============================================================================
// Loggers
// =============================================================================

/// Get or create a logger attached to the shared sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);
std::shared_ptr<spdlog::logger> get_logger(LogChannel channel);

std::shared_ptr<spdlog::logger> core_logger();
std::shared_ptr<spdlog::logger> packaging_logger();

// =============================================================================
// Levels
// =============================================================================

/// Set the global level; clears per-logger overrides
void set_global_log_level(spdlog::level::level_enum level);

/// Override the level of one logger, including one not created yet
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Parse a level name, case-insensitive ("warning", "err" and "fatal" are accepted)
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level) noexcept;

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// Traces entry and exit of a block with its duration
class LogScope {
public:
    LogScope(std::shared_ptr<spdlog::logger> logger, std::string name);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::shared_ptr<spdlog::logger> m_logger;
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
};

#define PYEMBED_LOG_SCOPE_CAT2(a, b) a##b
#define PYEMBED_LOG_SCOPE_CAT(a, b) PYEMBED_LOG_SCOPE_CAT2(a, b)
#define PYEMBED_LOG_SCOPE(logger, name) \
    ::pyembed_core::LogScope PYEMBED_LOG_SCOPE_CAT(pyembed_log_scope_, __LINE__)(logger, name)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Drop every pyembed logger and the shared sinks
void shutdown_logging();

} // namespace pyembed_core
