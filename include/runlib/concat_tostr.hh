#pragma once

#include <array>
#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>

template <class T>
constexpr bool is_string_argument = std::is_convertible_v<const T&, std::string_view> or
    std::is_convertible_v<const T&, const char*> or
    std::is_arithmetic_v<std::remove_cv_t<std::remove_reference_t<T>>>;

template <class T>
void append_stringified(std::string& str, const T& x) {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;
    if constexpr (std::is_same_v<U, char>) {
        str += x;
    } else if constexpr (std::is_same_v<U, bool>) {
        str += (x ? "true" : "false");
    } else if constexpr (std::is_integral_v<U>) {
        std::array<char, 24> buff{};
        auto [ptr, ec] = std::to_chars(buff.data(), buff.data() + buff.size(), x);
        str.append(buff.data(), ptr);
    } else if constexpr (std::is_floating_point_v<U>) {
        str += std::to_string(x);
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        str += std::string_view{x};
    } else {
        str += static_cast<const char*>(x);
    }
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string concat_tostr(Args&&... args) {
    std::string res;
    (append_stringified(res, args), ...);
    return res;
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string& back_insert(std::string& str, Args&&... args) {
    (append_stringified(str, args), ...);
    return str;
}
