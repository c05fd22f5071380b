#pragma once

/// @file error.hpp
/// @brief Error and Result types for pyembed
///
/// Fallible operations return Result<T>. An Error wraps one of the domain
/// error kinds (or a bare message), a coarse ErrorCode derived from it, and
/// optional key/value context added while the error propagates.

#include "fwd.hpp"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace pyembed_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// Coarse error category
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    InvalidArgument,
    NotFound,
    IOError,
    ParseError,
};

[[nodiscard]] const char* error_code_name(ErrorCode code) noexcept;

// =============================================================================
// Error Kinds
// =============================================================================

/// Rejected policy values
struct PolicyError {
    enum class Kind : std::uint8_t {
        InvalidPolicyValue,  // resources policy text
        InvalidFilterValue,  // extension module filter text
    };

    Kind kind;
    std::string message;
    std::string value;  // verbatim input

    [[nodiscard]] static PolicyError invalid_policy_value(const std::string& value) {
        return PolicyError{Kind::InvalidPolicyValue,
            "invalid value for Python Resources Policy: " + value, value};
    }

    [[nodiscard]] static PolicyError invalid_filter_value(const std::string& value) {
        return PolicyError{Kind::InvalidFilterValue,
            value + " is not a valid extension module filter", value};
    }
};

/// Policy document errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,
        FileUnreadable,
        Syntax,
        WrongType,
    };

    Kind kind;
    std::string message;
    std::string source;  // file path, empty for in-memory documents
    std::string key;     // WrongType only

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Policy file not found: " + path, path, {}};
    }

    [[nodiscard]] static ConfigError file_unreadable(const std::string& path) {
        return ConfigError{Kind::FileUnreadable, "Failed to open policy file: " + path, path, {}};
    }

    [[nodiscard]] static ConfigError syntax(const std::string& source, const std::string& detail) {
        return ConfigError{Kind::Syntax, "JSON parse error in " + source + ": " + detail, source, {}};
    }

    [[nodiscard]] static ConfigError wrong_type(const std::string& key, const std::string& expected) {
        return ConfigError{Kind::WrongType,
            "Policy key '" + key + "' must be " + expected, {}, key};
    }
};

[[nodiscard]] ErrorCode error_code_of(PolicyError::Kind kind) noexcept;
[[nodiscard]] ErrorCode error_code_of(ConfigError::Kind kind) noexcept;

// =============================================================================
// Error
// =============================================================================

class Error {
public:
    using Detail = std::variant<std::string, PolicyError, ConfigError>;

    Error(PolicyError err) : m_code(error_code_of(err.kind)), m_detail(std::move(err)) {}
    Error(ConfigError err) : m_code(error_code_of(err.kind)), m_detail(std::move(err)) {}
    Error(std::string msg) : m_code(ErrorCode::Unknown), m_detail(std::move(msg)) {}
    Error(const char* msg) : Error(std::string(msg)) {}
    Error(ErrorCode code, std::string msg) : m_code(code), m_detail(std::move(msg)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    [[nodiscard]] const std::string& message() const {
        return std::visit([](const auto& detail) -> const std::string& {
            if constexpr (std::is_same_v<std::decay_t<decltype(detail)>, std::string>) {
                return detail;
            } else {
                return detail.message;
            }
        }, m_detail);
    }

    template<typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(m_detail);
    }

    /// Typed detail, or nullptr when the error holds another kind
    template<typename T>
    [[nodiscard]] const T* as() const noexcept {
        return std::get_if<T>(&m_detail);
    }

    /// Attach context; an existing key is overwritten
    Error& with_context(const std::string& key, std::string value) & {
        m_context[key] = std::move(value);
        return *this;
    }

    Error&& with_context(const std::string& key, std::string value) && {
        m_context[key] = std::move(value);
        return std::move(*this);
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    ErrorCode m_code;
    Detail m_detail;
    std::map<std::string, std::string> m_context;
};

/// "[Code] message {key="value", ...}" with context keys in order
[[nodiscard]] std::string build_error_chain(const Error& error);

// =============================================================================
// Result<T, E>
// =============================================================================

/// Either a value or an error
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_storage(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_storage(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_storage.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_storage.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    /// Precondition: is_ok()
    [[nodiscard]] T& value() & { return *std::get_if<0>(&m_storage); }
    [[nodiscard]] const T& value() const& { return *std::get_if<0>(&m_storage); }
    [[nodiscard]] T&& value() && { return std::move(*std::get_if<0>(&m_storage)); }

    /// Precondition: is_err()
    [[nodiscard]] E& error() & { return *std::get_if<1>(&m_storage); }
    [[nodiscard]] const E& error() const& { return *std::get_if<1>(&m_storage); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    /// Value, or std::runtime_error when this holds an error
    [[nodiscard]] T& unwrap() & {
        if (is_err()) {
            throw std::runtime_error("unwrap() called on an error Result");
        }
        return value();
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) {
            throw std::runtime_error("unwrap() called on an error Result");
        }
        return std::move(*this).value();
    }

    template<typename F>
    auto map(F&& func) && -> Result<std::invoke_result_t<F, T&&>, E> {
        using U = std::invoke_result_t<F, T&&>;
        if (is_ok()) {
            return Result<U, E>(std::forward<F>(func)(std::move(*this).value()));
        }
        return Result<U, E>(std::move(error()));
    }

    template<typename F>
    auto and_then(F&& func) && -> std::invoke_result_t<F, T&&> {
        using R = std::invoke_result_t<F, T&&>;
        if (is_ok()) {
            return std::forward<F>(func)(std::move(*this).value());
        }
        return R(std::move(error()));
    }

private:
    std::variant<T, E> m_storage;
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)), m_failed(true) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_failed; }
    [[nodiscard]] bool is_err() const noexcept { return m_failed; }
    explicit operator bool() const noexcept { return !m_failed; }

    /// Precondition: is_err()
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

private:
    E m_error{std::string()};
    bool m_failed = false;
};

template<typename T>
[[nodiscard]] Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
[[nodiscard]] Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

} // namespace pyembed_core
