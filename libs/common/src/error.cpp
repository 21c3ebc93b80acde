#include "guard/common/error.hpp"

namespace guard {

// =============================================================================
// Codes and Category
// =============================================================================

StringView error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:             return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR:       return "UNKNOWN_ERROR";
        case ErrorCode::NULL_ARGUMENT:       return "NULL_ARGUMENT";
        case ErrorCode::OUT_OF_RANGE:        return "OUT_OF_RANGE";
        case ErrorCode::PRECONDITION_FAILED: return "PRECONDITION_FAILED";
        case ErrorCode::ILLEGAL_STRING:      return "ILLEGAL_STRING";
        case ErrorCode::ILLEGAL_NUMBER:      return "ILLEGAL_NUMBER";
        case ErrorCode::ILLEGAL_BOOLEAN:     return "ILLEGAL_BOOLEAN";
        case ErrorCode::EMPTY_CONTAINER:     return "EMPTY_CONTAINER";
        case ErrorCode::CONFIG_ERROR:        return "CONFIG_ERROR";
    }
    return "UNKNOWN";
}

const char* GuardErrorCategory::name() const noexcept {
    return "guard";
}

String GuardErrorCategory::message(int code) const {
    switch (static_cast<ErrorCode>(code)) {
        case ErrorCode::SUCCESS:             return "Success";
        case ErrorCode::NULL_ARGUMENT:       return "Null argument";
        case ErrorCode::OUT_OF_RANGE:        return "Index out of bounds";
        case ErrorCode::PRECONDITION_FAILED: return "Precondition failed";
        case ErrorCode::ILLEGAL_STRING:      return "Illegal string";
        case ErrorCode::ILLEGAL_NUMBER:      return "Illegal number";
        case ErrorCode::ILLEGAL_BOOLEAN:     return "Illegal boolean";
        case ErrorCode::EMPTY_CONTAINER:     return "Empty container";
        case ErrorCode::CONFIG_ERROR:        return "Configuration error";
        default:                             return "Unknown error";
    }
}

const std::error_category& guard_error_category() noexcept {
    static const GuardErrorCategory category;
    return category;
}

std::error_code make_error_code(ErrorCode code) noexcept {
    return std::error_code(static_cast<int>(code), guard_error_category());
}

// =============================================================================
// ErrorInfo
// =============================================================================

ErrorInfo::ErrorInfo(ErrorCode c, String msg, String comp, std::source_location loc)
    : code(c), message(std::move(msg)), component(std::move(comp)), location(loc) {}

ErrorInfo& ErrorInfo::with_context(String key, String value) {
    context.insert_or_assign(std::move(key), std::move(value));
    return *this;
}

String ErrorInfo::to_string() const {
    const int value = static_cast<int>(code);
    return std::format("[{}] {}: {}", value, guard_error_category().message(value), message);
}

String ErrorInfo::format_full() const {
    String report = std::format("Error: {}\n", to_string());
    report += std::format("  Component: {}\n", component.empty() ? "unknown" : component);
    report += std::format("  Origin: {}:{} ({})\n",
                          location.file_name(), location.line(), location.function_name());
    for (const auto& [key, value] : context) {
        report += std::format("  {} = {}\n", key, value);
    }
    return report;
}

// =============================================================================
// Exceptions
// =============================================================================

GuardException::GuardException(ErrorInfo info)
    : std::runtime_error(info.message), info_(std::move(info)) {}

NullArgumentException::NullArgumentException(const String& message)
    : GuardException(ErrorInfo(ErrorCode::NULL_ARGUMENT, message)) {}

PreconditionFailedException::PreconditionFailedException(const String& message)
    : GuardException(ErrorInfo(ErrorCode::PRECONDITION_FAILED, message)) {}

EmptyContainerException::EmptyContainerException(const String& message)
    : PreconditionFailedException(ErrorInfo(ErrorCode::EMPTY_CONTAINER, message)) {}

IndexOutOfBoundsException::IndexOutOfBoundsException(const String& message)
    : GuardException(ErrorInfo(ErrorCode::OUT_OF_RANGE, message)) {}

void throw_error(const ErrorInfo& info) {
    switch (info.code) {
        case ErrorCode::NULL_ARGUMENT:
            throw NullArgumentException(info);
        case ErrorCode::OUT_OF_RANGE:
            throw IndexOutOfBoundsException(info);
        case ErrorCode::EMPTY_CONTAINER:
            throw EmptyContainerException(info);
        case ErrorCode::PRECONDITION_FAILED:
        case ErrorCode::ILLEGAL_STRING:
        case ErrorCode::ILLEGAL_NUMBER:
        case ErrorCode::ILLEGAL_BOOLEAN:
            throw PreconditionFailedException(info);
        default:
            throw GuardException(info);
    }
}

} // namespace guard
