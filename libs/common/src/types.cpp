#include "guard/common/types.hpp"
#include <cctype>

namespace guard {

namespace {
constexpr StringView WHITESPACE = " \t\n\r\f\v";
}

String to_upper(StringView text) {
    String upper;
    upper.reserve(text.size());
    for (unsigned char c : text) {
        upper.push_back(static_cast<char>(std::toupper(c)));
    }
    return upper;
}

String trim(StringView text) {
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == StringView::npos) return {};
    const auto last = text.find_last_not_of(WHITESPACE);
    return String(text.substr(first, last - first + 1));
}

bool starts_with(StringView text, StringView prefix) {
    return text.starts_with(prefix);
}

bool starts_with(StringView text, StringView prefix, Int64 offset) {
    if (offset < 0 || static_cast<UInt64>(offset) > text.size()) return false;
    return text.substr(static_cast<Size>(offset)).starts_with(prefix);
}

bool ends_with(StringView text, StringView suffix) {
    return text.ends_with(suffix);
}

} // namespace guard
