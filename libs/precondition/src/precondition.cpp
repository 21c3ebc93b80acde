// =============================================================================
// Guard Preconditions - Throwing API Implementation
// Version: 1.0.0
// =============================================================================

#include "guard/precondition/precondition.hpp"
#include "guard/common/logging.hpp"

namespace guard::precondition {

namespace {

logging::Logger& logger() {
    static SharedPtr<logging::Logger> instance =
        logging::LogManager::instance().get_logger("guard.precondition");
    return *instance;
}

} // anonymous namespace

// =============================================================================
// Raising
// =============================================================================

namespace detail {

void raise(const ErrorInfo& failure) {
    logger().debug("{} {}", error_code_name(failure.code), failure.message);
    throw_error(failure);
}

void raise(const ErrorInfo& failure, StringView message) {
    // A missing argument keeps its own diagnostic.
    if (failure.code == ErrorCode::NULL_ARGUMENT) raise(failure);

    ErrorInfo replaced = failure;
    replaced.message = String(message);
    raise(replaced);
}

void raise(const ErrorInfo& failure, const std::exception_ptr& error) {
    if (failure.code == ErrorCode::NULL_ARGUMENT) raise(failure);
    raise_override(failure, error);
}

void raise_override(const ErrorInfo& failure, const std::exception_ptr& error) {
    logger().debug("{} {} (override raised)", error_code_name(failure.code), failure.message);
    std::rethrow_exception(error);
}

void raise_null_error() {
    raise(make_failure(ErrorCode::NULL_ARGUMENT, String(messages::NULL_ERROR)));
}

} // namespace detail

// =============================================================================
// String Checks
// =============================================================================

void require_non_blank(TextRef value) {
    detail::enforce(check_non_blank(value));
}

void require_non_blank(TextRef value, Message message) {
    detail::enforce(check_non_blank(value), message.view());
}

void require_non_blank(TextRef value, const std::exception_ptr& error) {
    detail::enforce(check_non_blank(value), error);
}

void require_non_empty(TextRef value) {
    detail::enforce(check_non_empty(value));
}

void require_non_empty(TextRef value, Message message) {
    // Absent text is reported with the caller's message too.
    if (value.is_null()) {
        detail::raise(make_failure(ErrorCode::NULL_ARGUMENT, String(message.view())));
    }
    detail::enforce(check_non_empty(value), message.view());
}

void require_non_empty(TextRef value, const std::exception_ptr& error) {
    detail::enforce(check_non_empty(value), error);
}

void require_start_with(TextRef sequence, TextRef prefix) {
    detail::enforce(check_start_with(sequence, prefix));
}

void require_start_with(TextRef sequence, TextRef prefix, Message message) {
    detail::enforce(check_start_with(sequence, prefix), message.view());
}

void require_start_with(TextRef sequence, TextRef prefix, const std::exception_ptr& error) {
    detail::enforce(check_start_with(sequence, prefix), error);
}

void require_start_with(TextRef sequence, TextRef prefix, Int64 offset) {
    detail::enforce(check_start_with(sequence, prefix, offset));
}

void require_start_with(TextRef sequence, TextRef prefix, Int64 offset, Message message) {
    detail::enforce(check_start_with(sequence, prefix, offset), message.view());
}

void require_start_with(TextRef sequence, TextRef prefix, Int64 offset,
                        const std::exception_ptr& error) {
    detail::enforce(check_start_with(sequence, prefix, offset), error);
}

void require_end_with(TextRef sequence, TextRef suffix) {
    detail::enforce(check_end_with(sequence, suffix));
}

void require_end_with(TextRef sequence, TextRef suffix, Message message) {
    detail::enforce(check_end_with(sequence, suffix), message.view());
}

void require_end_with(TextRef sequence, TextRef suffix, const std::exception_ptr& error) {
    detail::enforce(check_end_with(sequence, suffix), error);
}

// =============================================================================
// Boolean Checks
// =============================================================================

void require_true(bool condition) {
    detail::enforce(check_true(condition));
}

void require_true(bool condition, Message message) {
    detail::enforce(check_true(condition), message.view());
}

void require_true(bool condition, const std::exception_ptr& error) {
    detail::enforce(check_true(condition), error);
}

void require_false(bool condition) {
    detail::enforce(check_false(condition));
}

void require_false(bool condition, Message message) {
    detail::enforce(check_false(condition), message.view());
}

void require_false(bool condition, const std::exception_ptr& error) {
    detail::enforce(check_false(condition), error);
}

} // namespace guard::precondition
