#pragma once

#include "gradebox/concat_tostr.hh"

#include <cerrno>
#include <cstring>
#include <string>

// Returns " - <errnum>: <description of errnum>"
inline std::string errmsg(int errnum) {
    return concat_tostr(" - ", errnum, ": ", std::strerror(errnum));
}

inline std::string errmsg() { return errmsg(errno); }
