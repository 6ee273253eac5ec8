#pragma once

#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>

namespace detail {

template <class T>
void append_tostr(std::string& str, const T& val) {
    if constexpr (std::is_same_v<T, char>) {
        str += val;
    } else if constexpr (std::is_same_v<T, bool>) {
        str += val ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        char buff[64];
        auto res = std::to_chars(buff, buff + sizeof(buff), val);
        str.append(buff, res.ptr);
    } else if constexpr (std::is_enum_v<T>) {
        append_tostr(str, static_cast<std::underlying_type_t<T>>(val));
    } else {
        str += std::string_view{val};
    }
}

} // namespace detail

// Concatenates string-like and arithmetic arguments into a new string
template <class... Args>
std::string concat_tostr(const Args&... args) {
    std::string res;
    (detail::append_tostr(res, args), ...);
    return res;
}
