#pragma once

#include <cstddef>
#include <string>

// Fills @p dest with @p bytes bytes from getrandom(), throws std::runtime_error on error
void fill_randomly(void* dest, size_t bytes);

inline std::string random_bytes(size_t len) {
    std::string bytes(len, '\0');
    fill_randomly(bytes.data(), bytes.size());
    return bytes;
}
