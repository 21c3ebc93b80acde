// =============================================================================
// Guard Preconditions - Checks Implementation
// Version: 1.0.0
// =============================================================================

#include "guard/precondition/checks.hpp"

namespace guard::precondition {

namespace {

Result<void> null_text() {
    return make_failure(ErrorCode::NULL_ARGUMENT, String(messages::NULL_OBJECT));
}

} // anonymous namespace

ErrorInfo make_failure(ErrorCode code, String message) {
    return ErrorInfo(code, std::move(message), String(COMPONENT));
}

// =============================================================================
// String Checks
// =============================================================================

Result<void> check_non_blank(TextRef value) {
    if (value.is_null()) return null_text();
    if (value.view().empty()) {
        return make_failure(ErrorCode::ILLEGAL_STRING, String(messages::BLANK_STRING));
    }
    return make_success();
}

Result<void> check_non_empty(TextRef value) {
    return check_non_blank(value);
}

Result<void> check_start_with(TextRef sequence, TextRef prefix) {
    if (sequence.is_null() || prefix.is_null()) return null_text();
    if (!starts_with(sequence.view(), prefix.view())) {
        auto failure = make_failure(ErrorCode::ILLEGAL_STRING,
            std::format("String must start with the {} prefix, but {} was given",
                        prefix.view(), sequence.view()));
        failure.with_context("sequence", String(sequence.view()))
               .with_context("prefix", String(prefix.view()));
        return failure;
    }
    return make_success();
}

Result<void> check_start_with(TextRef sequence, TextRef prefix, Int64 offset) {
    if (sequence.is_null() || prefix.is_null()) return null_text();
    if (!starts_with(sequence.view(), prefix.view(), offset)) {
        auto failure = make_failure(ErrorCode::ILLEGAL_STRING,
            std::format("String must start with the {} prefix from {} index, but {} was given",
                        prefix.view(), offset, sequence.view()));
        failure.with_context("sequence", String(sequence.view()))
               .with_context("prefix", String(prefix.view()))
               .with_context("offset", std::to_string(offset));
        return failure;
    }
    return make_success();
}

Result<void> check_end_with(TextRef sequence, TextRef suffix) {
    if (sequence.is_null() || suffix.is_null()) return null_text();
    if (!ends_with(sequence.view(), suffix.view())) {
        auto failure = make_failure(ErrorCode::ILLEGAL_STRING,
            std::format("String must end with the {} suffix, but {} was given",
                        suffix.view(), sequence.view()));
        failure.with_context("sequence", String(sequence.view()))
               .with_context("suffix", String(suffix.view()));
        return failure;
    }
    return make_success();
}

// =============================================================================
// Boolean Checks
// =============================================================================

Result<void> check_true(bool condition) {
    if (!condition) {
        return make_failure(ErrorCode::ILLEGAL_BOOLEAN, String(messages::MUST_BE_TRUE));
    }
    return make_success();
}

Result<void> check_false(bool condition) {
    if (condition) {
        return make_failure(ErrorCode::ILLEGAL_BOOLEAN, String(messages::MUST_BE_FALSE));
    }
    return make_success();
}

} // namespace guard::precondition
