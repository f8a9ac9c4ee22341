#pragma once

#include <charconv>
#include <optional>
#include <string_view>
#include <type_traits>

constexpr bool has_prefix(std::string_view str, std::string_view prefix) noexcept {
    return str.substr(0, prefix.size()) == prefix;
}

constexpr bool has_suffix(std::string_view str, std::string_view suffix) noexcept {
    return str.size() >= suffix.size() and str.substr(str.size() - suffix.size()) == suffix;
}

constexpr bool is_digit(char c) noexcept { return c >= '0' and c <= '9'; }

constexpr bool is_space(char c) noexcept {
    return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\v' or c == '\f';
}

// Whole @p str has to be a number
template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
std::optional<T> str2num(std::string_view str) noexcept {
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size() or str.empty()) {
        return std::nullopt;
    }
    return res;
}
