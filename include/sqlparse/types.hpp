// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Error Handling Types                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>
#include <string>
#include <variant>
#include <stdexcept>
#include <utility>
#include <type_traits>

namespace sqlparse {

// ==============================================================================
// Error Codes
// ==============================================================================

/// Parse error codes, grouped by stage
enum class ErrorCode : std::uint32_t {
    Success = 0,

    // Statement classification
    InvalidQueryType = 100,

    // Grammar (raised by the state machine)
    UnexpectedToken = 200,
    UnexpectedEnd = 201,
    InvalidQualifiedName = 202,
    InvalidRowCount = 203,
    ValueCountMismatch = 204,

    // Structural validation
    EmptyWhereClause = 300,
    MissingQueryType = 301,
    MissingTableName = 302,
    MissingWhereClause = 303,
    InvalidCondition = 304,
    MissingInsertRows = 305,

    InvalidArgument = 900,
    InternalError = 999,
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidQueryType: return "Invalid query type";
        case ErrorCode::UnexpectedToken: return "Unexpected token";
        case ErrorCode::UnexpectedEnd: return "Unexpected end of query";
        case ErrorCode::InvalidQualifiedName: return "Invalid qualified name";
        case ErrorCode::InvalidRowCount: return "Invalid row count";
        case ErrorCode::ValueCountMismatch: return "Value count mismatch";
        case ErrorCode::EmptyWhereClause: return "Empty WHERE clause";
        case ErrorCode::MissingQueryType: return "Missing query type";
        case ErrorCode::MissingTableName: return "Missing table name";
        case ErrorCode::MissingWhereClause: return "Missing WHERE clause";
        case ErrorCode::InvalidCondition: return "Invalid condition";
        case ErrorCode::MissingInsertRows: return "Missing insert rows";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/// Sentinel for errors that are not tied to a cursor position
inline constexpr std::size_t NO_POSITION = std::numeric_limits<std::size_t>::max();

/// Parse error with context
class Error {
public:
    Error() noexcept : code_(ErrorCode::Success) {}

    explicit Error(ErrorCode code) noexcept : code_(code) {}

    Error(ErrorCode code, std::string message, std::size_t position = NO_POSITION) noexcept
        : code_(code), message_(std::move(message)), position_(position) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] std::size_t position() const noexcept { return position_; }
    [[nodiscard]] bool has_position() const noexcept { return position_ != NO_POSITION; }
    [[nodiscard]] bool ok() const noexcept { return code_ == ErrorCode::Success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !ok(); }

    /// True for errors raised by the post-parse structural checks
    [[nodiscard]] bool is_validation_error() const noexcept {
        auto value = static_cast<std::uint32_t>(code_);
        return value >= 300 && value < 400;
    }

    void set_position(std::size_t position) noexcept { position_ = position; }

    [[nodiscard]] std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_to_string(code_));
        }
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::size_t position_{NO_POSITION};
};

// ==============================================================================
// Result<T>
// ==============================================================================

/// Tag type for constructing error result
struct ErrorTag {};
inline constexpr ErrorTag error_tag{};

/// Result type for operations that can fail
template<typename T>
class Result {
public:
    using value_type = T;
    using error_type = Error;

    // Success constructors
    Result(const T& value) : storage_(value), has_value_(true) {}
    Result(T&& value) : storage_(std::move(value)), has_value_(true) {}

    // Error constructors
    Result(ErrorTag, const Error& err) : storage_(err), has_value_(false) {}
    Result(ErrorTag, Error&& err) : storage_(std::move(err)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code) : storage_(Error(code)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code, std::string msg)
        : storage_(Error(code, std::move(msg))), has_value_(false) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] T& value() & {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] const Error& error() const& {
        if (has_value_) throw std::runtime_error("Result has value, not error");
        return std::get<Error>(storage_);
    }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(value()); }

    template<typename U>
    [[nodiscard]] T value_or(U&& default_value) const& {
        return has_value_ ? value() : static_cast<T>(std::forward<U>(default_value));
    }

    template<typename U>
    [[nodiscard]] T value_or(U&& default_value) && {
        return has_value_ ? std::move(value()) : static_cast<T>(std::forward<U>(default_value));
    }

private:
    std::variant<T, Error> storage_;
    bool has_value_;
};

// ==============================================================================
// Result<void> specialization (Status)
// ==============================================================================

template<>
class Result<void> {
public:
    using value_type = void;
    using error_type = Error;

    Result() : error_(), has_value_(true) {}

    Result(ErrorTag, const Error& err) : error_(err), has_value_(false) {}
    Result(ErrorTag, Error&& err) : error_(std::move(err)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code) : error_(code), has_value_(false) {}
    Result(ErrorTag, ErrorCode code, std::string msg)
        : error_(code, std::move(msg)), has_value_(false) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    void value() const {
        if (!has_value_) throw std::runtime_error("Result has no value");
    }

    [[nodiscard]] const Error& error() const& {
        if (has_value_) throw std::runtime_error("Result has value, not error");
        return error_;
    }

private:
    Error error_;
    bool has_value_;
};

/// Status is an alias for Result<void>
using Status = Result<void>;

// ==============================================================================
// Factory functions
// ==============================================================================

/// Create success result with value
template<typename T>
[[nodiscard]] Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

/// Create success status (void result)
[[nodiscard]] inline Status Ok() {
    return Status();
}

/// Create error result
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(error_tag, code, std::move(message));
}

template<typename T>
[[nodiscard]] Result<T> Err(const Error& error) {
    return Result<T>(error_tag, error);
}

/// Create error status
[[nodiscard]] inline Status Err(ErrorCode code, std::string message, std::size_t position = NO_POSITION) {
    return Status(error_tag, Error(code, std::move(message), position));
}

[[nodiscard]] inline Status Err(const Error& error) {
    return Status(error_tag, error);
}

} // namespace sqlparse
