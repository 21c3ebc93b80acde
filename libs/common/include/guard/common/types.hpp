#pragma once
// =============================================================================
// Guard Preconditions - Core Types (C++20)
// Version: 1.0.0
// Aliases, value concepts, diagnostic number text and text helpers
// =============================================================================

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace guard {

// =============================================================================
// Aliases
// =============================================================================
using Int8 = std::int8_t;
using Int16 = std::int16_t;
using Int32 = std::int32_t;
using Int64 = std::int64_t;
using UInt8 = std::uint8_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using Size = std::size_t;

using String = std::string;
using StringView = std::string_view;

template<typename T> using Vector = std::vector<T>;
template<typename T> using Optional = std::optional<T>;
template<typename... Ts> using Variant = std::variant<Ts...>;
template<typename T> using UniquePtr = std::unique_ptr<T>;
template<typename T> using SharedPtr = std::shared_ptr<T>;

using SystemClock = std::chrono::system_clock;
using SystemTimePoint = SystemClock::time_point;
using Milliseconds = std::chrono::milliseconds;

// =============================================================================
// Value Concepts
// =============================================================================
template<typename T>
concept FloatingPoint = std::is_floating_point_v<T>;

template<typename T>
concept Numeric = std::is_integral_v<T> || FloatingPoint<T>;

// Arithmetic types a sign check makes sense for. bool and the plain
// character types are left out; signed char counts as a byte.
template<typename T>
concept SignedNumber = Numeric<T> && std::is_signed_v<T>
    && !std::same_as<T, bool> && !std::same_as<T, char>
    && !std::same_as<T, wchar_t>;

template<typename T>
concept Container = requires(const T& c) {
    typename T::value_type;
    { c.begin() };
    { c.end() };
    { c.size() } -> std::convertible_to<Size>;
};

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
inline constexpr bool is_optional_v = is_optional<std::remove_cvref_t<T>>::value;

// Pointers, smart pointers, std::function, std::exception_ptr and
// std::optional: everything that can be "absent".
template<typename T>
concept Nullable = is_optional_v<T> || requires(const std::remove_cvref_t<T>& v) {
    { v == nullptr } -> std::convertible_to<bool>;
};

// =============================================================================
// Number Text
// =============================================================================

// 8-bit integers print as numbers. Floating values always show a fraction,
// an exponent, inf or nan ("-1.0", "1e+20").
template<Numeric T>
[[nodiscard]] String format_number(T value) {
    if constexpr (FloatingPoint<T>) {
        auto text = std::format("{}", value);
        if (text.find_first_of(".eEn") == String::npos) text.append(".0");
        return text;
    } else if constexpr (sizeof(T) == 1) {
        return std::to_string(static_cast<int>(value));
    } else {
        return std::to_string(value);
    }
}

// =============================================================================
// Text Helpers
// =============================================================================
[[nodiscard]] String to_upper(StringView text);
[[nodiscard]] String trim(StringView text);

[[nodiscard]] bool starts_with(StringView text, StringView prefix);
// A negative offset, or one past the end, never matches.
[[nodiscard]] bool starts_with(StringView text, StringView prefix, Int64 offset);
[[nodiscard]] bool ends_with(StringView text, StringView suffix);

} // namespace guard
