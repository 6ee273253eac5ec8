#pragma once

#include "sandtool/concat_tostr.hh"

#include <stdexcept>

#define THROW(...)                                                                        \
    throw std::runtime_error(concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":", __LINE__, ')'))
