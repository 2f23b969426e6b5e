// =============================================================================
// gpack - Error Handling Framework Implementation
// =============================================================================

#include "gpack/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace gpack {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!field.empty()) {
        oss << "field: " << field;
        hasContent = true;
    }

    if (value.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "value: " << *value;
        hasContent = true;
    }

    if (limit.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "max: " << *limit;
        hasContent = true;
    }

    if (index.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "index: " << *index;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// GPackException Implementation
// =============================================================================

void GPackException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// FieldOverflowError Implementation
// =============================================================================

std::string FieldOverflowError::formatFieldOverflow(std::string_view field,
                                                    std::uint64_t value,
                                                    std::uint64_t max) {
    return fmt::format("{} value {} exceeds maximum {}", field, value, max);
}

// =============================================================================
// Error Implementation
// =============================================================================

GPackException Error::toException() const {
    ErrorContext ctx = context_.value_or(ErrorContext{});
    switch (code_) {
        case ErrorCode::kUsageError:
            return UsageError(message_, std::move(ctx));
        case ErrorCode::kInvalidArgument:
            return InvalidArgumentError(message_, std::move(ctx));
        case ErrorCode::kCapacityExceeded:
            return CapacityExceededError(message_, std::move(ctx));
        case ErrorCode::kFieldOverflow:
            return FieldOverflowError(message_, std::move(ctx));
        case ErrorCode::kInvalidSymbol:
            return InvalidSymbolError(message_, std::move(ctx));
        case ErrorCode::kSuccess:
            return GPackException(ErrorCode::kSuccess, message_);
    }
    return GPackException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    ErrorContext ctx = context_.value_or(ErrorContext{});
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_, std::move(ctx));
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_, std::move(ctx));
        case ErrorCode::kCapacityExceeded:
            throw CapacityExceededError(message_, std::move(ctx));
        case ErrorCode::kFieldOverflow:
            throw FieldOverflowError(message_, std::move(ctx));
        case ErrorCode::kInvalidSymbol:
            throw InvalidSymbolError(message_, std::move(ctx));
        case ErrorCode::kSuccess:
            throw GPackException(ErrorCode::kSuccess, message_);
    }
    throw GPackException(code_, message_);
}

}  // namespace gpack
