#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <gradebox/concat_tostr.hh>
#include <gradebox/errmsg.hh>
#include <gradebox/string_traits.hh>
#include <gtest/gtest.h>
#include <string>
#include <string_view>

// NOLINTNEXTLINE
TEST(concat_tostr, mixed_args) {
    ASSERT_EQ(
        concat_tostr("a", std::string{"b"}, std::string_view{"c"}, 'd', 42, -7, true),
        "abcd42-7true"
    );
    ASSERT_EQ(concat_tostr(std::filesystem::path{"/x/y"}, '/'), "/x/y/");
    ASSERT_EQ(concat_tostr(), "");
}

// NOLINTNEXTLINE
TEST(errmsg, format) {
    ASSERT_EQ(errmsg(ENOENT), " - 2: No such file or directory");
    errno = EACCES;
    ASSERT_EQ(errmsg(), " - 13: Permission denied");
}

// NOLINTNEXTLINE
TEST(string_traits, prefix_and_suffix) {
    ASSERT_TRUE(has_prefix("./a.out", "./"));
    ASSERT_FALSE(has_prefix(".", "./"));
    ASSERT_TRUE(has_suffix("main.c", ".c"));
    ASSERT_FALSE(has_suffix("c", ".c"));
    ASSERT_TRUE(has_suffix("x", ""));
}

// NOLINTNEXTLINE
TEST(string_traits, str2num) {
    ASSERT_EQ(str2num<uint32_t>("10"), 10U);
    ASSERT_EQ(str2num<int>("-3"), -3);
    ASSERT_EQ(str2num<uint32_t>(""), std::nullopt);
    ASSERT_EQ(str2num<uint32_t>("10s"), std::nullopt);
    ASSERT_EQ(str2num<uint32_t>("-1"), std::nullopt);
    ASSERT_EQ(str2num<uint8_t>("256"), std::nullopt);
}
