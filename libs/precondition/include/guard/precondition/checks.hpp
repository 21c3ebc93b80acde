#pragma once
// =============================================================================
// Guard Preconditions - Checks
// Version: 1.0.0
// Non-throwing core: every check reports its outcome as Result<void>
// =============================================================================

#include "guard/common/types.hpp"
#include "guard/common/error.hpp"
#include "guard/precondition/traits.hpp"

namespace guard::precondition {

inline constexpr StringView COMPONENT = "precondition";

namespace messages {
    constexpr StringView NULL_OBJECT = "Object must not be null";
    constexpr StringView NULL_ERROR = "Error object must not be null";
    constexpr StringView BLANK_STRING = "String must not be blank";
    constexpr StringView MUST_BE_TRUE = "Boolean must be true, but false was given";
    constexpr StringView MUST_BE_FALSE = "Boolean must be false, but true was given";
}

// ErrorInfo tagged with this component.
[[nodiscard]] ErrorInfo make_failure(ErrorCode code, String message);

// =============================================================================
// Null Check
// =============================================================================

template<Nullable T>
[[nodiscard]] Result<void> check_non_null(const T& value) {
    if (is_null(value)) {
        return make_failure(ErrorCode::NULL_ARGUMENT, String(messages::NULL_OBJECT));
    }
    return make_success();
}

// =============================================================================
// String Checks
// =============================================================================

// Fails only on the exact empty string; whitespace is content.
[[nodiscard]] Result<void> check_non_blank(TextRef value);
[[nodiscard]] Result<void> check_non_empty(TextRef value);

[[nodiscard]] Result<void> check_start_with(TextRef sequence, TextRef prefix);
[[nodiscard]] Result<void> check_start_with(TextRef sequence, TextRef prefix, Int64 offset);
[[nodiscard]] Result<void> check_end_with(TextRef sequence, TextRef suffix);

// =============================================================================
// Container Checks
// =============================================================================

template<ElementContainer C>
[[nodiscard]] Result<void> check_non_empty(const C& container) {
    if (container.size() == 0) {
        return make_failure(ErrorCode::EMPTY_CONTAINER,
            std::format("{} must contain at least one or more elements",
                        to_string(container_kind<C>())));
    }
    return make_success();
}

// Built-in arrays are reported as "Array". Character arrays are string
// literals and go to the text overload.
template<typename T, Size N>
    requires (!CharacterType<T>)
[[nodiscard]] Result<void> check_non_empty(const T (&array)[N]) {
    return check_non_empty(std::span<const T, N>(array));
}

template<ElementContainer C>
[[nodiscard]] Result<void> check_non_empty(const C* container) {
    if (container == nullptr) {
        return make_failure(ErrorCode::NULL_ARGUMENT, String(messages::NULL_OBJECT));
    }
    return check_non_empty(*container);
}

// =============================================================================
// Sign Checks
// =============================================================================

// Zero is positive.
template<SignedNumber T>
[[nodiscard]] Result<void> check_positive(T number) {
    if (number < T{0}) {
        auto failure = make_failure(ErrorCode::ILLEGAL_NUMBER,
            std::format("{} must be positive but {} was given",
                        number_subject<T>(), format_number(number)));
        failure.with_context("value", format_number(number));
        return failure;
    }
    return make_success();
}

// Zero is not negative.
template<SignedNumber T>
[[nodiscard]] Result<void> check_negative(T number) {
    if (number >= T{0}) {
        auto failure = make_failure(ErrorCode::ILLEGAL_NUMBER,
            std::format("{} must be negative but {} was given",
                        number_subject<T>(), format_number(number)));
        failure.with_context("value", format_number(number));
        return failure;
    }
    return make_success();
}

// =============================================================================
// Range Checks
// =============================================================================
// Bounds are inclusive. Bound parameters take the index type so that
// literals convert to the index width.

template<SignedNumber T>
[[nodiscard]] Result<void> check_range_from(T index, std::type_identity_t<T> from) {
    if (index < from) {
        auto failure = make_failure(ErrorCode::OUT_OF_RANGE,
            std::format("{} {} out-of-bounds for range from length {}",
                        index_subject<T>(), format_number(index), format_number(from)));
        failure.with_context("index", format_number(index))
               .with_context("from", format_number(from));
        return failure;
    }
    return make_success();
}

template<SignedNumber T>
[[nodiscard]] Result<void> check_range_to(T index, std::type_identity_t<T> to) {
    if (to < index) {
        auto failure = make_failure(ErrorCode::OUT_OF_RANGE,
            std::format("{} {} out-of-bounds for range from length 0 to length {}",
                        index_subject<T>(), format_number(index), format_number(to)));
        failure.with_context("index", format_number(index))
               .with_context("to", format_number(to));
        return failure;
    }
    return make_success();
}

// Reversed bounds are not rejected on their own; the comparison decides.
template<SignedNumber T>
[[nodiscard]] Result<void> check_range(T index, std::type_identity_t<T> from,
                                       std::type_identity_t<T> to) {
    if (index < from || to < index) {
        auto failure = make_failure(ErrorCode::OUT_OF_RANGE,
            std::format("{} {} out-of-bounds for range from length {} to length {}",
                        index_subject<T>(), format_number(index),
                        format_number(from), format_number(to)));
        failure.with_context("index", format_number(index))
               .with_context("from", format_number(from))
               .with_context("to", format_number(to));
        return failure;
    }
    return make_success();
}

// =============================================================================
// Boolean Checks
// =============================================================================

[[nodiscard]] Result<void> check_true(bool condition);
[[nodiscard]] Result<void> check_false(bool condition);

} // namespace guard::precondition
