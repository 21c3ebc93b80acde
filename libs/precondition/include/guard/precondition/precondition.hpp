#pragma once
// =============================================================================
// Guard Preconditions - Throwing API
// Version: 1.0.0
// require_* guards: return silently when the check holds, throw otherwise
// =============================================================================
//
// Every guard comes in three forms:
//   require_x(args...)                        default exception, default message
//   require_x(args..., Message message)       default exception, caller message
//   require_x(args..., std::exception_ptr e)  rethrows e on failure
//
// A null override (an empty exception_ptr or a literal nullptr) is itself a
// null-argument failure, raised even when the value is valid.
//
// =============================================================================

#include "guard/common/types.hpp"
#include "guard/common/error.hpp"
#include "guard/precondition/checks.hpp"
#include <exception>
#include <type_traits>
#include <utility>

namespace guard::precondition {

namespace detail {

[[noreturn]] void raise(const ErrorInfo& failure);
[[noreturn]] void raise(const ErrorInfo& failure, StringView message);
[[noreturn]] void raise(const ErrorInfo& failure, const std::exception_ptr& error);
// Rethrows error whatever the failure code.
[[noreturn]] void raise_override(const ErrorInfo& failure, const std::exception_ptr& error);
[[noreturn]] void raise_null_error();

inline void enforce(const Result<void>& outcome) {
    if (outcome.is_error()) raise(outcome.error());
}

inline void enforce(const Result<void>& outcome, StringView message) {
    if (outcome.is_error()) raise(outcome.error(), message);
}

inline void enforce(const Result<void>& outcome, const std::exception_ptr& error) {
    if (!error) raise_null_error();
    if (outcome.is_error()) raise(outcome.error(), error);
}

} // namespace detail

// =============================================================================
// Null Check
// =============================================================================

// Lvalues come back as the same reference; rvalues are moved into the
// returned value so the result never refers to a dead temporary.
template<typename T>
using Checked = std::conditional_t<std::is_lvalue_reference_v<T>, T, std::remove_cvref_t<T>>;

// Returns the argument so it can be validated inline:
//   auto conn = require_non_null(pool.acquire());
template<Nullable T>
Checked<T> require_non_null(T&& value) {
    detail::enforce(check_non_null(value));
    return std::forward<T>(value);
}

// The caller's message replaces the null diagnostic.
template<Nullable T>
Checked<T> require_non_null(T&& value, Message message) {
    if (is_null(value)) {
        detail::raise(make_failure(ErrorCode::NULL_ARGUMENT, String(message.view())));
    }
    return std::forward<T>(value);
}

// A null value rethrows the override.
template<Nullable T>
Checked<T> require_non_null(T&& value, const std::exception_ptr& error) {
    if (!error) detail::raise_null_error();
    auto outcome = check_non_null(value);
    if (outcome.is_error()) detail::raise_override(outcome.error(), error);
    return std::forward<T>(value);
}

// =============================================================================
// String Checks
// =============================================================================

void require_non_blank(TextRef value);
void require_non_blank(TextRef value, Message message);
void require_non_blank(TextRef value, const std::exception_ptr& error);

void require_non_empty(TextRef value);
void require_non_empty(TextRef value, Message message);
void require_non_empty(TextRef value, const std::exception_ptr& error);

void require_start_with(TextRef sequence, TextRef prefix);
void require_start_with(TextRef sequence, TextRef prefix, Message message);
void require_start_with(TextRef sequence, TextRef prefix, const std::exception_ptr& error);
void require_start_with(TextRef sequence, TextRef prefix, Int64 offset);
void require_start_with(TextRef sequence, TextRef prefix, Int64 offset, Message message);
void require_start_with(TextRef sequence, TextRef prefix, Int64 offset,
                        const std::exception_ptr& error);

void require_end_with(TextRef sequence, TextRef suffix);
void require_end_with(TextRef sequence, TextRef suffix, Message message);
void require_end_with(TextRef sequence, TextRef suffix, const std::exception_ptr& error);

// =============================================================================
// Container Checks
// =============================================================================

template<ElementContainer C>
void require_non_empty(const C& container) {
    detail::enforce(check_non_empty(container));
}

template<ElementContainer C>
void require_non_empty(const C& container, Message message) {
    detail::enforce(check_non_empty(container), message.view());
}

template<ElementContainer C>
void require_non_empty(const C& container, const std::exception_ptr& error) {
    detail::enforce(check_non_empty(container), error);
}

template<typename T, Size N>
    requires (!CharacterType<T>)
void require_non_empty(const T (&array)[N]) {
    detail::enforce(check_non_empty(array));
}

template<typename T, Size N>
    requires (!CharacterType<T>)
void require_non_empty(const T (&array)[N], Message message) {
    detail::enforce(check_non_empty(array), message.view());
}

template<typename T, Size N>
    requires (!CharacterType<T>)
void require_non_empty(const T (&array)[N], const std::exception_ptr& error) {
    detail::enforce(check_non_empty(array), error);
}

template<ElementContainer C>
void require_non_empty(const C* container) {
    detail::enforce(check_non_empty(container));
}

template<ElementContainer C>
void require_non_empty(const C* container, Message message) {
    detail::enforce(check_non_empty(container), message.view());
}

template<ElementContainer C>
void require_non_empty(const C* container, const std::exception_ptr& error) {
    detail::enforce(check_non_empty(container), error);
}

// =============================================================================
// Sign Checks
// =============================================================================

template<SignedNumber T>
void require_positive(T number) {
    detail::enforce(check_positive(number));
}

template<SignedNumber T>
void require_positive(T number, Message message) {
    detail::enforce(check_positive(number), message.view());
}

template<SignedNumber T>
void require_positive(T number, const std::exception_ptr& error) {
    detail::enforce(check_positive(number), error);
}

template<SignedNumber T>
void require_negative(T number) {
    detail::enforce(check_negative(number));
}

template<SignedNumber T>
void require_negative(T number, Message message) {
    detail::enforce(check_negative(number), message.view());
}

template<SignedNumber T>
void require_negative(T number, const std::exception_ptr& error) {
    detail::enforce(check_negative(number), error);
}

// =============================================================================
// Range Checks
// =============================================================================

template<SignedNumber T>
void require_range_from(T index, std::type_identity_t<T> from) {
    detail::enforce(check_range_from(index, from));
}

template<SignedNumber T>
void require_range_from(T index, std::type_identity_t<T> from, Message message) {
    detail::enforce(check_range_from(index, from), message.view());
}

template<SignedNumber T>
void require_range_from(T index, std::type_identity_t<T> from,
                        const std::exception_ptr& error) {
    detail::enforce(check_range_from(index, from), error);
}

template<SignedNumber T>
void require_range_to(T index, std::type_identity_t<T> to) {
    detail::enforce(check_range_to(index, to));
}

template<SignedNumber T>
void require_range_to(T index, std::type_identity_t<T> to, Message message) {
    detail::enforce(check_range_to(index, to), message.view());
}

template<SignedNumber T>
void require_range_to(T index, std::type_identity_t<T> to,
                      const std::exception_ptr& error) {
    detail::enforce(check_range_to(index, to), error);
}

template<SignedNumber T>
void require_range(T index, std::type_identity_t<T> from, std::type_identity_t<T> to) {
    detail::enforce(check_range(index, from, to));
}

template<SignedNumber T>
void require_range(T index, std::type_identity_t<T> from, std::type_identity_t<T> to,
                   Message message) {
    detail::enforce(check_range(index, from, to), message.view());
}

template<SignedNumber T>
void require_range(T index, std::type_identity_t<T> from, std::type_identity_t<T> to,
                   const std::exception_ptr& error) {
    detail::enforce(check_range(index, from, to), error);
}

// =============================================================================
// Boolean Checks
// =============================================================================

void require_true(bool condition);
void require_true(bool condition, Message message);
void require_true(bool condition, const std::exception_ptr& error);

void require_false(bool condition);
void require_false(bool condition, Message message);
void require_false(bool condition, const std::exception_ptr& error);

} // namespace guard::precondition
