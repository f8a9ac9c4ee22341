#include "../../test_identity.hh"

#include <chrono>
#include <gradebox/file_contents.hh>
#include <gradebox/grading/run_command.hh>
#include <gradebox/temporary_directory.hh>
#include <gtest/gtest.h>
#include <string>

using gradebox::grading::CommandReport;
using gradebox::grading::report_text;
using gradebox::grading::run_command;
using gradebox::grading::RunContext;
using gradebox::grading::RunLimits;
using Status = CommandReport::Status;
using namespace std::chrono_literals;

namespace {

RunContext context(RunLimits limits = {}) {
    return {
        .working_dir = "/",
        .stdin_fd = -1,
        .identity = test_identity(),
        .limits = limits,
    };
}

} // namespace

// NOLINTNEXTLINE
TEST(run_command, ok_with_merged_output) {
    auto report = run_command({"/bin/sh", "-c", "echo a; echo b >&2; echo c"}, context());
    ASSERT_EQ(report.status, Status::OK);
    ASSERT_EQ(report.output, "a\nb\nc\n");
    ASSERT_EQ(report_text(report), "a\nb\nc\n");
}

// NOLINTNEXTLINE
TEST(run_command, non_zero_exit_adds_nothing) {
    auto report = run_command({"/bin/sh", "-c", "echo fail; exit 3"}, context());
    ASSERT_EQ(report.status, Status::NonZeroExit);
    ASSERT_EQ(report.comment, "exited with 3");
    ASSERT_EQ(report_text(report), "fail\n");
}

// NOLINTNEXTLINE
TEST(run_command, not_found) {
    auto report = run_command({"no-such-command-gradebox", "x"}, context());
    ASSERT_EQ(report.status, Status::NotFound);
    ASSERT_FALSE(report.result.has_value());
    auto text = report_text(report);
    ASSERT_EQ(text.substr(0, 16), "File not found: ");
    ASSERT_NE(text.find("no-such-command-gradebox"), std::string::npos);
}

// NOLINTNEXTLINE
TEST(run_command, time_limit) {
    auto report = run_command(
        {"/bin/sh", "-c", "echo started; sleep 10"}, context({.time_limit = 300ms})
    );
    ASSERT_EQ(report.status, Status::TimeLimitExceeded);
    ASSERT_EQ(report_text(report), "started\n[time limit exceeded (0.300 s)]\n");

    report = run_command({"/bin/sh", "-c", "printf x; sleep 10"}, context({.time_limit = 1s}));
    ASSERT_EQ(report.status, Status::TimeLimitExceeded);
    ASSERT_EQ(report_text(report), "x\n[time limit exceeded (1 s)]\n");
}

// NOLINTNEXTLINE
TEST(run_command, time_limit_with_busy_loop) {
    auto report =
        run_command({"/bin/sh", "-c", "while :; do :; done"}, context({.time_limit = 300ms}));
    ASSERT_EQ(report.status, Status::TimeLimitExceeded);
}

// NOLINTNEXTLINE
TEST(run_command, output_limit) {
    auto report = run_command(
        {"/bin/sh", "-c", "head -c 100000 /dev/zero | tr '\\0' a; sleep 10"},
        context({.output_limit_in_bytes = 1000})
    );
    ASSERT_EQ(report.status, Status::OutputLimitExceeded);
    ASSERT_EQ(report.output, std::string(1000, 'a'));
    ASSERT_EQ(
        report_text(report),
        std::string(1000, 'a') + "\n[output size limit exceeded (1000 bytes)]\n"
    );
}

// NOLINTNEXTLINE
TEST(run_command, file_size_limit) {
    TemporaryDirectory tmp_dir{"/tmp/gradebox_test.XXXXXX"};
    grant_to_test_identity(tmp_dir.path());
    auto ctx = context({.file_size_limit_in_bytes = 1024});
    ctx.working_dir = tmp_dir.path();
    auto report = run_command({"dd", "if=/dev/zero", "of=out", "bs=4096", "count=4"}, ctx);
    ASSERT_EQ(report.status, Status::FileSizeLimitExceeded);
    ASSERT_LE(get_file_contents(tmp_dir.path() + "/out").size(), 1024U);
}

// NOLINTNEXTLINE
TEST(run_command, signaled) {
    auto report = run_command({"/bin/sh", "-c", "kill -SEGV $$"}, context());
    ASSERT_EQ(report.status, Status::Signaled);
    ASSERT_EQ(report_text(report), "[killed by signal SEGV - Segmentation fault]\n");
}

// NOLINTNEXTLINE
TEST(run_command, working_dir) {
    TemporaryDirectory tmp_dir{"/tmp/gradebox_test.XXXXXX"};
    put_file_contents(tmp_dir.path() + "/input.txt", "hello\n");
    grant_to_test_identity(tmp_dir.path());
    auto ctx = context();
    ctx.working_dir = tmp_dir.path();
    auto report = run_command({"cat", "input.txt"}, ctx);
    ASSERT_EQ(report.status, Status::OK);
    ASSERT_EQ(report.output, "hello\n");
}

// NOLINTNEXTLINE
TEST(run_command, empty_command) {
    ASSERT_THROW(run_command({}, context()), std::runtime_error);
}
