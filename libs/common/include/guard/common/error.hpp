#pragma once
// =============================================================================
// Guard Preconditions - Error Handling (C++20)
// Version: 1.0.0
// Error codes, failure descriptions, Result values and the exception taxonomy
// =============================================================================

#include "guard/common/types.hpp"
#include <map>
#include <stdexcept>
#include <system_error>

namespace guard {

// =============================================================================
// Error Codes
// =============================================================================
enum class ErrorCode : Int32 {
    SUCCESS = 0,

    // General (1000-1099)
    UNKNOWN_ERROR = 1000,
    NULL_ARGUMENT = 1002,
    OUT_OF_RANGE = 1003,

    // Precondition (2000-2099)
    PRECONDITION_FAILED = 2000,
    ILLEGAL_STRING = 2001,
    ILLEGAL_NUMBER = 2002,
    ILLEGAL_BOOLEAN = 2003,
    EMPTY_CONTAINER = 2004,

    // Configuration (3000-3099)
    CONFIG_ERROR = 3000
};

// Enumerator spelling, e.g. "EMPTY_CONTAINER".
[[nodiscard]] StringView error_code_name(ErrorCode code) noexcept;

class GuardErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override;
    [[nodiscard]] String message(int code) const override;
};

[[nodiscard]] const std::error_category& guard_error_category() noexcept;
[[nodiscard]] std::error_code make_error_code(ErrorCode code) noexcept;

} // namespace guard

template<>
struct std::is_error_code_enum<guard::ErrorCode> : std::true_type {};

namespace guard {

// =============================================================================
// ErrorInfo
// =============================================================================

// One failure: what went wrong, where it was detected, and the values
// involved (keyed by name, ordered for stable output).
struct ErrorInfo {
    ErrorCode code = ErrorCode::SUCCESS;
    String message;
    String component;
    std::source_location location;
    std::map<String, String> context;

    ErrorInfo() = default;
    ErrorInfo(ErrorCode c, String msg, String comp = {},
              std::source_location loc = std::source_location::current());

    ErrorInfo& with_context(String key, String value);

    // "[2002] Illegal number: <message>"
    [[nodiscard]] String to_string() const;
    // Multi-line report with component, origin and context.
    [[nodiscard]] String format_full() const;
};

// =============================================================================
// Result
// =============================================================================

template<typename T>
class Result {
private:
    Variant<T, ErrorInfo> state_;

public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrorInfo error) : state_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_success() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return state_.index() == 1; }
    explicit operator bool() const noexcept { return is_success(); }

    [[nodiscard]] const T& value() const& { return std::get<0>(state_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(state_)); }
    [[nodiscard]] const ErrorInfo& error() const { return std::get<1>(state_); }

    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
};

template<>
class Result<void> {
private:
    Optional<ErrorInfo> failure_;

public:
    Result() = default;
    Result(ErrorInfo error) : failure_(std::move(error)) {}

    [[nodiscard]] bool is_success() const noexcept { return !failure_; }
    [[nodiscard]] bool is_error() const noexcept { return failure_.has_value(); }
    explicit operator bool() const noexcept { return is_success(); }

    [[nodiscard]] const ErrorInfo& error() const { return *failure_; }
};

template<typename T>
[[nodiscard]] Result<T> make_success(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> make_success() {
    return {};
}

// Returns the failed Result<void> from the enclosing function.
#define GUARD_TRY_VOID(expr) \
    do { \
        auto guard_result_ = (expr); \
        if (guard_result_.is_error()) return guard_result_; \
    } while (0)

// =============================================================================
// Exceptions
// =============================================================================

// Root of everything the library throws. what() is the diagnostic message
// exactly as produced by the failing check.
class GuardException : public std::runtime_error {
private:
    ErrorInfo info_;

public:
    explicit GuardException(ErrorInfo info);

    [[nodiscard]] ErrorCode code() const noexcept { return info_.code; }
    [[nodiscard]] const ErrorInfo& error_info() const noexcept { return info_; }
    [[nodiscard]] String detailed_message() const { return info_.format_full(); }
};

// A required reference was absent: the checked value or the override error.
class NullArgumentException : public GuardException {
public:
    explicit NullArgumentException(ErrorInfo info) : GuardException(std::move(info)) {}
    explicit NullArgumentException(const String& message = "Object must not be null");
};

class PreconditionFailedException : public GuardException {
public:
    explicit PreconditionFailedException(ErrorInfo info) : GuardException(std::move(info)) {}
    explicit PreconditionFailedException(const String& message);
};

// Catchable as PreconditionFailedException.
class EmptyContainerException : public PreconditionFailedException {
public:
    explicit EmptyContainerException(ErrorInfo info) : PreconditionFailedException(std::move(info)) {}
    explicit EmptyContainerException(const String& message);
};

class IndexOutOfBoundsException : public GuardException {
public:
    explicit IndexOutOfBoundsException(ErrorInfo info) : GuardException(std::move(info)) {}
    explicit IndexOutOfBoundsException(const String& message);
};

// Throws the exception class that corresponds to info.code.
[[noreturn]] void throw_error(const ErrorInfo& info);

} // namespace guard
