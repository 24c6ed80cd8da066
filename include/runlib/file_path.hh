#pragma once

#include <string>

// Non-owning view of a null-terminated path
class FilePath {
    const char* str_;

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr FilePath(const char* str) noexcept
    : str_{str} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    FilePath(const std::string& str) noexcept
    : str_{str.c_str()} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr operator const char*() const noexcept { return str_; }

    [[nodiscard]] constexpr const char* data() const noexcept { return str_; }

    [[nodiscard]] std::string to_str() const { return str_; }
};
