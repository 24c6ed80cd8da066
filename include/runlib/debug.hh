#pragma once

#include <exception>
#include <runlib/logger.hh>
#include <runlib/macros/stringify.hh>

namespace runlib_debug {

constexpr bool is_va_empty() { return true; }

template <class T1, class... T>
constexpr bool is_va_empty(T1&& /*unused*/, T&&... /*unused*/) {
    return false;
}

constexpr const char* what_of() { return ""; }

inline const char* what_of(const std::exception& e) { return e.what(); }

} // namespace runlib_debug

// Logs the caught exception (if given) to errlog together with the place it was caught at
#define ERRLOG_CATCH(...)                                                        \
    errlog(                                                                      \
        __FILE__ ":" STRINGIFY(__LINE__) ": Caught exception",                   \
        ::runlib_debug::is_va_empty(__VA_ARGS__) ? "" : " -> ",                  \
        ::runlib_debug::what_of(__VA_ARGS__)                                     \
    )
