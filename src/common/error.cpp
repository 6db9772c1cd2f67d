// =============================================================================
// rarity-core - Error Handling Framework Implementation
// =============================================================================

#include "rarity/common/error.h"

#include <sstream>

namespace rarity {

namespace {

/// @brief Compose "[code] message (context)" as used by what() and describe().
std::string composeDescription(ErrorCode code, const std::string& message,
                               const std::optional<ErrorContext>& context) {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code) << "] " << message;

    if (context.has_value()) {
        std::string contextStr = context->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }
    return oss.str();
}

}  // namespace

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (itemId.has_value()) {
        separate();
        oss << "item: " << *itemId;
    }

    if (category.has_value()) {
        separate();
        oss << "category: \"" << *category << "\"";
    }

    if (!filePath.empty()) {
        separate();
        oss << "file: " << filePath;
    }

    if (lineNumber.has_value()) {
        separate();
        oss << "line: " << *lineNumber;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// RarityException Implementation
// =============================================================================

void RarityException::formatWhat() {
    what_ = composeDescription(code_, message_, context_);
}

// =============================================================================
// Error Implementation
// =============================================================================

std::string Error::describe() const {
    return composeDescription(code_, message_, context_);
}

RarityException Error::toException() const {
    ErrorContext ctx = context_.value_or(ErrorContext{});
    switch (code_) {
        case ErrorCode::kUsageError:
            return UsageError(message_, ctx);
        case ErrorCode::kIOError:
            return IOError(message_, ctx);
        case ErrorCode::kFormatError:
            return FormatError(message_, ctx);
        case ErrorCode::kEmptyCollection:
            return EmptyCollectionError(message_, ctx);
        case ErrorCode::kDataError:
            return DataError(message_, ctx);
        case ErrorCode::kDegenerateCategory:
            return DegenerateCategoryError(message_, ctx);
        default:
            break;
    }
    return RarityException(code_, message_, ctx);
}

[[noreturn]] void Error::throwException() const {
    ErrorContext ctx = context_.value_or(ErrorContext{});
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_, ctx);
        case ErrorCode::kIOError:
            throw IOError(message_, ctx);
        case ErrorCode::kFormatError:
            throw FormatError(message_, ctx);
        case ErrorCode::kEmptyCollection:
            throw EmptyCollectionError(message_, ctx);
        case ErrorCode::kDataError:
            throw DataError(message_, ctx);
        case ErrorCode::kDegenerateCategory:
            throw DegenerateCategoryError(message_, ctx);
        default:
            break;
    }
    throw RarityException(code_, message_, ctx);
}

}  // namespace rarity
