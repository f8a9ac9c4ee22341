#pragma once

#include "gradebox/concat_tostr.hh"

#include <stdexcept>

#define GRADEBOX_STRINGIZE_IMPL(x) #x
#define GRADEBOX_STRINGIZE(x) GRADEBOX_STRINGIZE_IMPL(x)

// Throws std::runtime_error with message being the concatenation of the arguments
#define THROW(...)                                                                         \
    throw std::runtime_error(concat_tostr(                                                 \
        __VA_ARGS__, " (thrown at " __FILE__ ":" GRADEBOX_STRINGIZE(__LINE__) ")"))
