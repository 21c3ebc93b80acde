#pragma once
// =============================================================================
// Guard Preconditions - Subject Traits
// Version: 1.0.0
// Classification of checked values: numeric widths, container kinds, text
// =============================================================================

#include "guard/common/types.hpp"
#include <array>
#include <span>

namespace guard::precondition {

// =============================================================================
// Numeric Widths
// =============================================================================

// Width label used in diagnostics. int carries no label.
template<SignedNumber T>
[[nodiscard]] constexpr StringView number_label() noexcept {
    if constexpr (std::same_as<T, float>) return "Float";
    else if constexpr (FloatingPoint<T>) return "Double";
    else if constexpr (sizeof(T) == 1) return "Byte";
    else if constexpr (sizeof(T) == 2) return "Short";
    else if constexpr (std::same_as<T, int>) return "";
    else return "Long";
}

// "Number", "Long number", ...
template<SignedNumber T>
[[nodiscard]] String number_subject() {
    constexpr StringView label = number_label<T>();
    return label.empty() ? String("Number") : std::format("{} number", label);
}

// "Index", "Long index", ...
template<SignedNumber T>
[[nodiscard]] String index_subject() {
    constexpr StringView label = number_label<T>();
    return label.empty() ? String("Index") : std::format("{} index", label);
}

// =============================================================================
// Container Kinds
// =============================================================================

enum class ContainerKind : UInt8 {
    LIST,
    MAP,
    SET,
    ARRAY
};

[[nodiscard]] constexpr StringView to_string(ContainerKind kind) {
    switch (kind) {
        case ContainerKind::LIST:  return "List";
        case ContainerKind::MAP:   return "Map";
        case ContainerKind::SET:   return "Set";
        case ContainerKind::ARRAY: return "Array";
    }
    return "Container";
}

template<typename T>
struct is_fixed_array : std::false_type {};

template<typename T, Size N>
struct is_fixed_array<std::array<T, N>> : std::true_type {};

template<typename T, Size E>
struct is_fixed_array<std::span<T, E>> : std::true_type {};

// Containers of elements; anything viewable as a string is checked as text.
template<typename C>
concept ElementContainer = Container<C> && !std::convertible_to<const C&, StringView>;

// Element types of string literals. Built-in arrays of these are text.
template<typename T>
concept CharacterType = std::same_as<std::remove_cv_t<T>, char>
    || std::same_as<std::remove_cv_t<T>, wchar_t>
    || std::same_as<std::remove_cv_t<T>, char8_t>
    || std::same_as<std::remove_cv_t<T>, char16_t>
    || std::same_as<std::remove_cv_t<T>, char32_t>;

template<ElementContainer C>
[[nodiscard]] constexpr ContainerKind container_kind() noexcept {
    if constexpr (is_fixed_array<C>::value) return ContainerKind::ARRAY;
    else if constexpr (requires { typename C::mapped_type; }) return ContainerKind::MAP;
    else if constexpr (requires { typename C::key_type; }) return ContainerKind::SET;
    else return ContainerKind::LIST;
}

// =============================================================================
// TextRef - string argument that may be absent
// =============================================================================

// Binds C strings, std::string and std::string_view. A null const char*
// yields an absent text.
class TextRef {
private:
    Optional<StringView> text_;

public:
    TextRef(std::nullptr_t) noexcept {}
    TextRef(const char* text) noexcept {
        if (text != nullptr) text_ = StringView(text);
    }
    TextRef(StringView text) noexcept : text_(text) {}
    TextRef(const String& text) noexcept : text_(StringView(text)) {}

    [[nodiscard]] bool is_null() const noexcept { return !text_.has_value(); }
    [[nodiscard]] StringView view() const noexcept { return text_.value_or(StringView{}); }
};

// =============================================================================
// Message - caller-supplied diagnostic
// =============================================================================

// Accepts anything viewable as a string except nullptr, so a literal null
// in the last argument selects the std::exception_ptr overload.
class Message {
private:
    StringView text_;

public:
    template<typename S>
        requires std::convertible_to<const S&, StringView>
              && (!std::same_as<S, std::nullptr_t>)
    Message(const S& text) : text_(text) {}

    [[nodiscard]] StringView view() const noexcept { return text_; }
};

// =============================================================================
// Null Detection
// =============================================================================

template<Nullable T>
[[nodiscard]] constexpr bool is_null(const T& value) noexcept {
    if constexpr (is_optional_v<T>) {
        return !value.has_value();
    } else {
        return value == nullptr;
    }
}

} // namespace guard::precondition
