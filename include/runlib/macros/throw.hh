#pragma once

#include <runlib/concat_tostr.hh>
#include <runlib/macros/stringify.hh>
#include <stdexcept>

// Very useful - includes exception origin
#define THROW(...)                                                                     \
    throw std::runtime_error(                                                          \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )
