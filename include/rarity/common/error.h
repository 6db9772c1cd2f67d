// =============================================================================
// rarity-core - Error Handling Framework
// =============================================================================
// Error handling for the rarity-core library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - RarityException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context carrying the offending item and category
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read failure)
// - 3: Trait table format error
// - 4: Empty collection
// - 5: Malformed item data (duplicate category, duplicate id)
// - 6: Catalog/item inconsistency
// - 7: Internal state error
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef RARITY_COMMON_ERROR_H
#define RARITY_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace rarity {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read failure, permission denied, etc.
    kIOError = 2,

    /// @brief Malformed trait table input.
    kFormatError = 3,

    /// @brief Zero items supplied; rarity is undefined.
    kEmptyCollection = 4,

    /// @brief An item violates a data invariant.
    /// @note Duplicate category within one item, duplicate external id.
    kDataError = 5,

    /// @brief Item and catalog disagree about a category.
    /// @note Indicates an upstream bug: the item was not part of the catalog.
    kDegenerateCategory = 6,

    /// @brief Invalid state for operation.
    kInvalidState = 7
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kEmptyCollection:
            return "empty collection";
        case ErrorCode::kDataError:
            return "data error";
        case ErrorCode::kDegenerateCategory:
            return "degenerate category";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Identifies the item and category an end user needs to fix the data.
struct ErrorContext {
    /// @brief External identifier of the offending item (display form).
    std::optional<std::string> itemId;

    /// @brief Trait category involved in the error.
    std::optional<std::string> category;

    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief 1-based line number in filePath (if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Set the item identifier.
    /// @return Reference to this for method chaining.
    ErrorContext& withItem(std::string id) {
        itemId = std::move(id);
        return *this;
    }

    /// @brief Set the category.
    /// @return Reference to this for method chaining.
    ErrorContext& withCategory(std::string name) {
        category = std::move(name);
        return *this;
    }

    /// @brief Set the file path.
    /// @return Reference to this for method chaining.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the line number.
    /// @return Reference to this for method chaining.
    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all rarity-core errors.
/// @note Provides error code, message, and optional context.
class RarityException : public std::exception {
public:
    /// @brief Construct with error code and message.
    RarityException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    RarityException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~RarityException() override = default;

    RarityException(const RarityException&) = default;
    RarityException(RarityException&&) noexcept = default;
    RarityException& operator=(const RarityException&) = default;
    RarityException& operator=(RarityException&&) noexcept = default;

    /// @brief Get the full error description including context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

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

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public RarityException {
public:
    explicit UsageError(std::string message)
        : RarityException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : RarityException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
class IOError : public RarityException {
public:
    explicit IOError(std::string message)
        : RarityException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : RarityException(ErrorCode::kIOError, std::move(message), std::move(context)) {}
};

/// @brief Exception for malformed trait tables (exit code 3).
class FormatError : public RarityException {
public:
    explicit FormatError(std::string message)
        : RarityException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : RarityException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception raised when a collection has no items (exit code 4).
class EmptyCollectionError : public RarityException {
public:
    explicit EmptyCollectionError(std::string message)
        : RarityException(ErrorCode::kEmptyCollection, std::move(message)) {}

    EmptyCollectionError(std::string message, ErrorContext context)
        : RarityException(ErrorCode::kEmptyCollection, std::move(message), std::move(context)) {}
};

/// @brief Exception for items that violate data invariants (exit code 5).
/// @note Duplicate category inside one item, or two items sharing an id.
class DataError : public RarityException {
public:
    explicit DataError(std::string message)
        : RarityException(ErrorCode::kDataError, std::move(message)) {}

    DataError(std::string message, ErrorContext context)
        : RarityException(ErrorCode::kDataError, std::move(message), std::move(context)) {}
};

/// @brief Exception for catalog/item inconsistencies (exit code 6).
/// @note Raised when an item claims a trait value its catalog never counted.
class DegenerateCategoryError : public RarityException {
public:
    explicit DegenerateCategoryError(std::string message)
        : RarityException(ErrorCode::kDegenerateCategory, std::move(message)) {}

    DegenerateCategoryError(std::string message, ErrorContext context)
        : RarityException(ErrorCode::kDegenerateCategory, std::move(message),
                          std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode, message and context.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Construct with error code, message and context.
    Error(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// @brief Construct from a RarityException.
    explicit Error(const RarityException& ex)
        : code_(ex.code()), message_(ex.message()), context_(ex.context()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Message with code and context, as what() of the matching exception.
    [[nodiscard]] std::string describe() const;

    /// @brief Convert to the appropriate exception type.
    [[nodiscard]] RarityException toException() const;

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

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const RarityException& ex) {
    return std::unexpected(Error{ex});
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

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message,
                                              ErrorContext context) {
    return std::unexpected(Error{code, std::move(message), std::move(context)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws RarityException (or derived) if the result contains an error.
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

}  // namespace rarity

#endif  // RARITY_COMMON_ERROR_H
