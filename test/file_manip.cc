#include <gradebox/file_contents.hh>
#include <gradebox/file_manip.hh>
#include <gradebox/temporary_directory.hh>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>
#include <vector>

using std::string;
using std::vector;

// NOLINTNEXTLINE
TEST(temporary_directory, removed_on_destruction) {
    string path;
    {
        TemporaryDirectory tmp_dir{"/tmp/gradebox_test.XXXXXX"};
        path = tmp_dir.path();
        ASSERT_TRUE(is_directory(path));
        ASSERT_EQ(mkdir(path + "/a/"), 0);
        put_file_contents(path + "/a/b", "xyz");
    }
    ASSERT_FALSE(is_directory(path));
}

// NOLINTNEXTLINE
TEST(temporary_directory, move) {
    TemporaryDirectory a{"/tmp/gradebox_test.XXXXXX"};
    auto path = a.path();
    TemporaryDirectory b = std::move(a);
    ASSERT_FALSE(a.exists()); // NOLINT(bugprone-use-after-move)
    ASSERT_EQ(b.path(), path);
    ASSERT_TRUE(is_directory(path));
}

// NOLINTNEXTLINE
TEST(file_manip, copy_and_list_directory) {
    TemporaryDirectory tmp_dir{"/tmp/gradebox_test.XXXXXX"};
    auto dir = tmp_dir.path();
    put_file_contents(dir + "/b.c", "int main() {}\n");
    ASSERT_EQ(copy(dir + "/b.c", dir + "/a.c"), 0);
    ASSERT_EQ(get_file_contents(dir + "/a.c"), "int main() {}\n");

    put_file_contents(dir + "/b.c", "x");
    ASSERT_EQ(copy(dir + "/b.c", dir + "/a.c"), 0); // overwrites
    ASSERT_EQ(get_file_contents(dir + "/a.c"), "x");

    ASSERT_EQ(mkdir(dir + "/C"), 0);
    ASSERT_EQ(list_directory(dir), (vector<string>{"C", "a.c", "b.c"}));
    ASSERT_EQ(copy(dir + "/missing", dir + "/x"), -1);
    ASSERT_THROW(list_directory(dir + "/missing"), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(file_manip, remove_r) {
    TemporaryDirectory tmp_dir{"/tmp/gradebox_test.XXXXXX"};
    auto dir = tmp_dir.path() + "/x";
    ASSERT_EQ(mkdir(dir), 0);
    ASSERT_EQ(mkdir(dir + "/y"), 0);
    put_file_contents(dir + "/y/z", "");
    ASSERT_EQ(remove_r(dir), 0);
    ASSERT_FALSE(is_directory(dir));
    ASSERT_EQ(list_directory(tmp_dir.path()), vector<string>{});
}

// NOLINTNEXTLINE
TEST(file_manip, rename_path) {
    TemporaryDirectory tmp_dir{"/tmp/gradebox_test.XXXXXX"};
    auto dir = tmp_dir.path();
    put_file_contents(dir + "/a", "a");
    ASSERT_EQ(rename_path(dir + "/a", dir + "/b"), 0);
    ASSERT_FALSE(is_regular_file(dir + "/a"));
    ASSERT_TRUE(is_regular_file(dir + "/b"));
    ASSERT_EQ(rename_path(dir + "/a", dir + "/c"), -1);
}

// NOLINTNEXTLINE
TEST(file_manip, path_absolute) {
    ASSERT_EQ(path_absolute("/a/b/../c/./d/"), "/a/c/d");
    ASSERT_EQ(path_absolute("/"), "/");
    char cwd[4096];
    ASSERT_NE(getcwd(cwd, sizeof(cwd)), nullptr);
    ASSERT_EQ(path_absolute("."), path_absolute(cwd));
    ASSERT_EQ(path_absolute("x/../y"), path_absolute(string{cwd} + "/y"));
}

// NOLINTNEXTLINE
TEST(file_contents, put_and_get) {
    TemporaryDirectory tmp_dir{"/tmp/gradebox_test.XXXXXX"};
    auto path = tmp_dir.path() + "/f";
    put_file_contents(path, "abc");
    put_file_contents(path, "de"); // truncates
    ASSERT_EQ(get_file_contents(path), "de");
    ASSERT_THROW(get_file_contents(tmp_dir.path() + "/missing"), std::runtime_error);
}
