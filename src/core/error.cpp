/// @file error.cpp
/// @brief Error code mapping and formatting

#include <pyembed/core/error.hpp>

#include <sstream>

namespace pyembed_core {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
    }
    return "Unknown";
}

ErrorCode error_code_of(PolicyError::Kind kind) noexcept {
    switch (kind) {
        case PolicyError::Kind::InvalidPolicyValue:
        case PolicyError::Kind::InvalidFilterValue:
            return ErrorCode::InvalidArgument;
    }
    return ErrorCode::Unknown;
}

ErrorCode error_code_of(ConfigError::Kind kind) noexcept {
    switch (kind) {
        case ConfigError::Kind::FileNotFound: return ErrorCode::NotFound;
        case ConfigError::Kind::FileUnreadable: return ErrorCode::IOError;
        case ConfigError::Kind::Syntax:
        case ConfigError::Kind::WrongType:
            return ErrorCode::ParseError;
    }
    return ErrorCode::Unknown;
}

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] " << error.message();

    const char* separator = " {";
    for (const auto& [key, value] : error.context()) {
        oss << separator << key << "=\"" << value << "\"";
        separator = ", ";
    }
    if (!error.context().empty()) {
        oss << "}";
    }

    return oss.str();
}

} // namespace pyembed_core
