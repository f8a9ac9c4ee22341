#include <gradebox/file_contents.hh>
#include <gradebox/grading/commands.hh>
#include <gradebox/temporary_directory.hh>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using gradebox::grading::Command;
using gradebox::grading::expand_command;
using gradebox::grading::parse_commands;
using std::vector;

// NOLINTNEXTLINE
TEST(commands, parse) {
    ASSERT_EQ(
        parse_commands("make\n"
                       "\n"
                       "  ./a.out   1\t2 \n"
                       "   \t\n"
                       "cat ../input.txt"),
        (vector<Command>{{"make"}, {"./a.out", "1", "2"}, {"cat", "../input.txt"}})
    );
    ASSERT_EQ(parse_commands(""), vector<Command>{});
    ASSERT_EQ(parse_commands("\r\n"), vector<Command>{});
}

// NOLINTNEXTLINE
TEST(commands, expand_relative_paths) {
    const std::string run_dir = "/home/grader/temp/run";
    ASSERT_EQ(
        expand_command({"./a.out", "../in.txt", "x/./y", "plain", "-o"}, run_dir),
        (Command{
            "./a.out",
            "/home/grader/temp/in.txt",
            "/home/grader/temp/run/x/y",
            "plain",
            "-o",
        })
    );
}

// NOLINTNEXTLINE
TEST(commands, expand_globs) {
    TemporaryDirectory tmp_dir{"/tmp/gradebox_test.XXXXXX"};
    const auto& dir = tmp_dir.path();
    put_file_contents(dir + "/main.c", "");
    put_file_contents(dir + "/a.h", "");
    put_file_contents(dir + "/b.h", "");

    ASSERT_EQ(expand_command({"gcc", "*.c"}, dir), (Command{"gcc", "main.c"}));
    // Several matches or none leave the argument unchanged
    ASSERT_EQ(expand_command({"cat", "*.h"}, dir), (Command{"cat", "*.h"}));
    ASSERT_EQ(expand_command({"cat", "*.txt"}, dir), (Command{"cat", "*.txt"}));
    // Absolute patterns stay absolute
    ASSERT_EQ(expand_command({dir + "/*.c"}, dir), (Command{dir + "/main.c"}));
}

// NOLINTNEXTLINE
TEST(commands, to_string) {
    ASSERT_EQ(gradebox::grading::to_string(Command{"gcc", "-o", "a.out", "main.c"}),
              "gcc -o a.out main.c");
}
