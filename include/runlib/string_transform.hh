#pragma once

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

constexpr char to_lower(char c) noexcept { return (c >= 'A' and c <= 'Z' ? c - 'A' + 'a' : c); }

inline std::string to_lower(std::string str) {
    for (auto& c : str) {
        c = to_lower(c);
    }
    return str;
}

constexpr char dec2hex(int x) noexcept {
    return static_cast<char>(x > 9 ? 'a' - 10 + x : x + '0');
}

/// Converts each byte of @p str to two hex digits using dec2hex()
inline std::string to_hex(std::string_view str) {
    std::string res;
    res.reserve(str.size() << 1);
    for (unsigned char c : str) {
        res += dec2hex(c >> 4);
        res += dec2hex(c & 15);
    }
    return res;
}

// Converts whole @p str to @p T or returns std::nullopt on errors like value
// represented in @p str is too big or invalid
template <class T, std::enable_if_t<std::is_integral_v<T> and not std::is_same_v<T, bool>, int> = 0>
std::optional<T> str2num(std::string_view str) noexcept {
    if (str.empty() or str[0] == '+') {
        return std::nullopt;
    }
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return res;
}
