/// @file log.cpp
/// @brief Shared-sink logger registry for pyembed

#include <pyembed/core/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace pyembed_core {

namespace {

struct LevelName {
    std::string_view name;
    spdlog::level::level_enum level;
};

// First entry per level is the canonical name
constexpr std::array<LevelName, 10> k_level_names = {{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"err", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"fatal", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

struct LoggerRegistry {
    std::mutex mutex;
    LogConfig config;
    std::vector<spdlog::sink_ptr> sinks;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    std::map<std::string, spdlog::level::level_enum> overrides;
    bool sinks_built = false;
};

LoggerRegistry& registry() {
    static LoggerRegistry reg;
    return reg;
}

/// Caller holds the registry lock
void build_sinks(LoggerRegistry& reg) {
    reg.sinks.clear();

    if (reg.config.console) {
        spdlog::sink_ptr console;
        if (reg.config.color) {
            console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        } else {
            console = std::make_shared<spdlog::sinks::stderr_sink_mt>();
        }
        console->set_pattern(reg.config.pattern);
        reg.sinks.push_back(std::move(console));
    }

    if (reg.config.log_file) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                reg.config.log_file->string());
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            reg.sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "pyembed: cannot open log file " << reg.config.log_file->string()
                      << ": " << e.what() << "\n";
        }
    }

    reg.sinks_built = true;
}

spdlog::level::level_enum effective_level(const LoggerRegistry& reg, const std::string& name) {
    auto it = reg.overrides.find(name);
    return it != reg.overrides.end() ? it->second : reg.config.level;
}

} // anonymous namespace

const char* log_channel_name(LogChannel channel) noexcept {
    switch (channel) {
        case LogChannel::Core: return "pyembed_core";
        case LogChannel::Packaging: return "pyembed_packaging";
    }
    return "pyembed";
}

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;
    build_sinks(reg);

    for (auto& [name, logger] : reg.loggers) {
        logger->sinks() = reg.sinks;
        logger->set_level(effective_level(reg, name));
    }
}

LogConfig current_log_config() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config;
}

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        return it->second;
    }

    if (!reg.sinks_built) {
        build_sinks(reg);
    }

    auto logger = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
    logger->set_level(effective_level(reg, name));
    reg.loggers.emplace(name, logger);

    // A logger of the same name may have been registered outside pyembed
    spdlog::drop(name);
    spdlog::register_logger(logger);
    return logger;
}

std::shared_ptr<spdlog::logger> get_logger(LogChannel channel) {
    return get_logger(std::string(log_channel_name(channel)));
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger(LogChannel::Core);
}

std::shared_ptr<spdlog::logger> packaging_logger() {
    return get_logger(LogChannel::Packaging);
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config.level = level;
    reg.overrides.clear();
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.overrides[name] = level;
    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        it->second->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : k_level_names) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) noexcept {
    for (const auto& entry : k_level_names) {
        if (entry.level == level) {
            return entry.name.data();
        }
    }
    return "unknown";
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(std::shared_ptr<spdlog::logger> logger, std::string name)
    : m_logger(std::move(logger))
    , m_name(std::move(name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace("begin {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("end {} ({:.3f} ms)", m_name, elapsed.count());
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
}

void shutdown_logging() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
        spdlog::drop(name);
    }
    reg.loggers.clear();
    reg.overrides.clear();
    reg.sinks.clear();
    reg.sinks_built = false;
}

} // namespace pyembed_core
