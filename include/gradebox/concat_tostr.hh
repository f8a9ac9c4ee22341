#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <type_traits>

namespace detail {

template <class T>
void append_tostr(std::string& str, const T& x) {
    if constexpr (std::is_same_v<T, char>) {
        str += x;
    } else if constexpr (std::is_same_v<T, bool>) {
        str += x ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        str += std::to_string(x);
    } else if constexpr (std::is_same_v<T, std::filesystem::path>) {
        str += x.native();
    } else {
        str += std::string_view{x};
    }
}

} // namespace detail

template <class... Args>
std::string concat_tostr(const Args&... args) {
    std::string res;
    (detail::append_tostr(res, args), ...);
    return res;
}
