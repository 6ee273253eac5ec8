#pragma once

#include "sandtool/concat_tostr.hh"

#include <cerrno>
#include <cstring>
#include <string>

// Returns " - <errno name>: <description> (os error <errnum>)"
inline std::string errmsg(int errnum) {
    const char* name = strerrorname_np(errnum);
    const char* descr = strerrordesc_np(errnum);
    return concat_tostr(
        " - ", name ? name : "unknown", ": ", descr ? descr : "Unknown error", " (os error ",
        errnum, ')');
}

inline std::string errmsg() { return errmsg(errno); }
