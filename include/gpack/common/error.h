// =============================================================================
// gpack - Error Handling Framework
// =============================================================================
// Error handling for the gpack packing library.
//
// This module provides:
// - ErrorCode enum covering every way an encode can be rejected
// - GPackException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - ErrorContext carrying the offending field, value, limit and index
//
// Codec operations report failures through Result<T>; the exception types
// exist for callers that prefer to unwrap with unwrapOrThrow().
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef GPACK_COMMON_ERROR_H
#define GPACK_COMMON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace gpack {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes for packing operations.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Invalid configuration (PackerOptions, logger config).
    kUsageError = 1,

    /// @brief Argument outside the domain of the operation.
    /// @note Capacity wider than a word, mismatched sequence lengths, etc.
    kInvalidArgument = 2,

    /// @brief Element count times 2 bits exceeds the target capacity.
    kCapacityExceeded = 3,

    /// @brief A variant record field does not fit its bit width.
    kFieldOverflow = 4,

    /// @brief Input value outside the closed 4-symbol alphabet.
    kInvalidSymbol = 5
};

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kCapacityExceeded:
            return "capacity exceeded";
        case ErrorCode::kFieldOverflow:
            return "field overflow";
        case ErrorCode::kInvalidSymbol:
            return "invalid symbol";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Identifies which input element or record field was rejected.
struct ErrorContext {
    /// @brief Name of the rejected field ("chrom", "position", "symbol", ...).
    std::string field;

    /// @brief Offending value (if applicable).
    std::optional<std::uint64_t> value;

    /// @brief Largest allowed value (if applicable).
    std::optional<std::uint64_t> limit;

    /// @brief Index of the offending element in the input (if applicable).
    std::optional<std::size_t> index;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with field name.
    explicit ErrorContext(std::string fieldName,
                          std::source_location loc = std::source_location::current())
        : field(std::move(fieldName)), location(loc) {}

    /// @brief Set the field name.
    /// @return Reference to this for method chaining.
    ErrorContext& withField(std::string fieldName) {
        field = std::move(fieldName);
        return *this;
    }

    /// @brief Set the offending value.
    /// @return Reference to this for method chaining.
    ErrorContext& withValue(std::uint64_t v) {
        value = v;
        return *this;
    }

    /// @brief Set the largest allowed value.
    /// @return Reference to this for method chaining.
    ErrorContext& withLimit(std::uint64_t max) {
        limit = max;
        return *this;
    }

    /// @brief Set the element index.
    /// @return Reference to this for method chaining.
    ErrorContext& withIndex(std::size_t i) {
        index = i;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all gpack errors.
class GPackException : public std::exception {
public:
    /// @brief Construct with error code and message.
    GPackException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    GPackException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~GPackException() override = default;

    GPackException(const GPackException&) = default;
    GPackException(GPackException&&) noexcept = default;
    GPackException& operator=(const GPackException&) = default;
    GPackException& operator=(GPackException&&) noexcept = default;

    /// @brief Get the formatted error message.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for invalid configuration.
class UsageError : public GPackException {
public:
    explicit UsageError(std::string message)
        : GPackException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : GPackException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for arguments outside an operation's domain.
class InvalidArgumentError : public GPackException {
public:
    explicit InvalidArgumentError(std::string message)
        : GPackException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : GPackException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief Exception raised when a sequence does not fit its target word.
class CapacityExceededError : public GPackException {
public:
    explicit CapacityExceededError(std::string message)
        : GPackException(ErrorCode::kCapacityExceeded, std::move(message)) {}

    CapacityExceededError(std::string message, ErrorContext context)
        : GPackException(ErrorCode::kCapacityExceeded, std::move(message), std::move(context)) {}
};

/// @brief Exception raised when a variant field exceeds its bit width.
/// @note Carries the field name, the offending value and the largest
///       allowed value.
class FieldOverflowError : public GPackException {
public:
    explicit FieldOverflowError(std::string message)
        : GPackException(ErrorCode::kFieldOverflow, std::move(message)) {}

    FieldOverflowError(std::string message, ErrorContext context)
        : GPackException(ErrorCode::kFieldOverflow, std::move(message), std::move(context)) {}

    /// @brief Construct from the rejected field.
    /// @param field Field name.
    /// @param value Offending value.
    /// @param max Largest value the field can hold.
    FieldOverflowError(std::string_view field, std::uint64_t value, std::uint64_t max)
        : GPackException(ErrorCode::kFieldOverflow,
                         formatFieldOverflow(field, value, max),
                         ErrorContext{std::string(field)}.withValue(value).withLimit(max)) {}

    /// @brief Format the canonical field overflow message.
    [[nodiscard]] static std::string formatFieldOverflow(std::string_view field,
                                                         std::uint64_t value,
                                                         std::uint64_t max);
};

/// @brief Exception raised for values outside the closed alphabet.
class InvalidSymbolError : public GPackException {
public:
    explicit InvalidSymbolError(std::string message)
        : GPackException(ErrorCode::kInvalidSymbol, std::move(message)) {}

    InvalidSymbolError(std::string message, ErrorContext context)
        : GPackException(ErrorCode::kInvalidSymbol, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode, message and context.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct with error code, message and context.
    Error(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// @brief Construct from a GPackException.
    explicit Error(const GPackException& ex)
        : code_(ex.code()), message_(ex.message()), context_(ex.context()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Convert to the appropriate exception type.
    [[nodiscard]] GPackException toException() const;

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result with context.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message, ErrorContext context) {
    return std::unexpected(Error{code, std::move(message), std::move(context)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws GPackException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert gpack exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const GPackException& ex) {
        return std::unexpected(Error{ex});
    }
}

}  // namespace gpack

#endif  // GPACK_COMMON_ERROR_H
