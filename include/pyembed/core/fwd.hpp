#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for pyembed_core module

#include <cstdint>

namespace pyembed_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct PolicyError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace pyembed_core
