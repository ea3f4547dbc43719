#pragma once

/// @file error.hpp
/// @brief Error handling types for modkit_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace modkit_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    IncompatibleVersion,
    DependencyMissing,
    DependencyCycle,
    TypeMismatch,
    OutOfRange,
    TestFailed,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        case ErrorCode::DependencyCycle: return "DependencyCycle";
        case ErrorCode::TypeMismatch: return "TypeMismatch";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::TestFailed: return "TestFailed";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Manifest parsing and validation errors
struct ManifestError {
    enum class Kind : std::uint8_t {
        ParseFailed,     // Manifest text is not a valid document
        MissingField,    // Required field absent or empty
        InvalidField,    // Field present with the wrong type
        InvalidVersion,  // Version does not start with major.minor.patch
    };

    Kind kind;
    std::string message;
    std::string source;  // Manifest path, if known
    std::string field;

    [[nodiscard]] static ManifestError parse_failed(const std::string& source, const std::string& reason) {
        return ManifestError{Kind::ParseFailed, "Failed to parse manifest " + source + ": " + reason, source, {}};
    }

    [[nodiscard]] static ManifestError missing_field(const std::string& source, const std::string& field) {
        return ManifestError{Kind::MissingField,
            "Manifest " + source + " is missing required field '" + field + "'", source, field};
    }

    [[nodiscard]] static ManifestError invalid_field(const std::string& source, const std::string& field,
                                                     const std::string& expected) {
        return ManifestError{Kind::InvalidField,
            "Manifest " + source + " field '" + field + "' must be " + expected, source, field};
    }

    [[nodiscard]] static ManifestError invalid_version(const std::string& source, const std::string& version) {
        return ManifestError{Kind::InvalidVersion,
            "Manifest " + source + " has invalid version '" + version + "' (expected major.minor.patch)",
            source, "version"};
    }
};

/// Load-order resolution errors (always fatal to the resolution pass)
struct ResolveError {
    enum class Kind : std::uint8_t {
        MissingDependency,    // Hard dependency not among discovered mods
        CircularDependency,   // Hard dependency reached while still being visited
        IncompatibleVersion,  // Dependency present but fails its version constraint
    };

    Kind kind;
    std::string message;
    std::string mod_id;
    std::string dependency;
    std::vector<std::string> cycle;  // For CircularDependency

    [[nodiscard]] static ResolveError missing_dependency(const std::string& mod, const std::string& dep) {
        return ResolveError{Kind::MissingDependency,
            "Mod '" + mod + "' depends on '" + dep + "' which is not installed", mod, dep, {}};
    }

    [[nodiscard]] static ResolveError circular_dependency(const std::string& mod, const std::string& dep,
                                                          std::vector<std::string> cycle_path) {
        std::string path;
        for (std::size_t i = 0; i < cycle_path.size(); ++i) {
            if (i > 0) path += " -> ";
            path += cycle_path[i];
        }
        return ResolveError{Kind::CircularDependency,
            "Circular dependency detected: " + path, mod, dep, std::move(cycle_path)};
    }

    [[nodiscard]] static ResolveError incompatible_version(const std::string& mod, const std::string& dep,
                                                           const std::string& required, const std::string& found) {
        return ResolveError{Kind::IncompatibleVersion,
            "Mod '" + mod + "' requires '" + dep + " " + required + "' but found version " + found,
            mod, dep, {}};
    }
};

/// Patch shape and execution errors
struct PatchError {
    enum class Kind : std::uint8_t {
        InvalidOperation,  // Unknown op, bad path syntax, missing value/from
        PathNotFound,      // Pointer does not address an existing location
        TypeMismatch,      // Container kind does not support the operation
        OutOfRange,        // Array index outside the allowed bounds
        TestFailed,        // test operation value mismatch
    };

    Kind kind;
    std::string message;
    std::string path;
    std::string expected;  // For TestFailed
    std::string actual;    // For TestFailed

    [[nodiscard]] static PatchError invalid_operation(const std::string& reason, const std::string& path = {}) {
        return PatchError{Kind::InvalidOperation, "Invalid patch operation: " + reason, path, {}, {}};
    }

    [[nodiscard]] static PatchError path_not_found(const std::string& path) {
        return PatchError{Kind::PathNotFound, "Path not found: " + path, path, {}, {}};
    }

    [[nodiscard]] static PatchError type_mismatch(const std::string& path, const std::string& reason) {
        return PatchError{Kind::TypeMismatch, "Type mismatch at " + path + ": " + reason, path, {}, {}};
    }

    [[nodiscard]] static PatchError out_of_range(const std::string& path, const std::string& index) {
        return PatchError{Kind::OutOfRange, "Array index out of range at " + path + ": " + index, path, {}, {}};
    }

    [[nodiscard]] static PatchError test_failed(const std::string& path, const std::string& expected_json,
                                                const std::string& actual_json) {
        return PatchError{Kind::TestFailed,
            "Test failed at " + path + ": expected " + expected_json + " but got " + actual_json,
            path, expected_json, actual_json};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ManifestError,
        ResolveError,
        PatchError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ManifestError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ResolveError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(PatchError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ManifestError::Kind kind) {
        switch (kind) {
            case ManifestError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ManifestError::Kind::MissingField: return ErrorCode::ValidationError;
            case ManifestError::Kind::InvalidField: return ErrorCode::ValidationError;
            case ManifestError::Kind::InvalidVersion: return ErrorCode::ValidationError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ResolveError::Kind kind) {
        switch (kind) {
            case ResolveError::Kind::MissingDependency: return ErrorCode::DependencyMissing;
            case ResolveError::Kind::CircularDependency: return ErrorCode::DependencyCycle;
            case ResolveError::Kind::IncompatibleVersion: return ErrorCode::IncompatibleVersion;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(PatchError::Kind kind) {
        switch (kind) {
            case PatchError::Kind::InvalidOperation: return ErrorCode::InvalidArgument;
            case PatchError::Kind::PathNotFound: return ErrorCode::NotFound;
            case PatchError::Kind::TypeMismatch: return ErrorCode::TypeMismatch;
            case PatchError::Kind::OutOfRange: return ErrorCode::OutOfRange;
            case PatchError::Kind::TestFailed: return ErrorCode::TestFailed;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace modkit_core
