#include <gradebox/concat_tostr.hh>
#include <gradebox/environment.hh>
#include <gradebox/file_contents.hh>
#include <gradebox/temporary_directory.hh>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using gradebox::CheckResult;
using gradebox::find_in_path;
using Status = CheckResult::Status;

namespace {

const CheckResult& find_check(const gradebox::EnvironmentReport& report, std::string_view name) {
    for (const auto& check : report.checks) {
        if (check.name == name) {
            return check;
        }
    }
    throw std::runtime_error{concat_tostr("no check named ", name)};
}

} // namespace

// NOLINTNEXTLINE
TEST(environment, find_in_path) {
    ASSERT_EQ(find_in_path("sh", "/nonexistent:/bin"), "/bin/sh");
    ASSERT_EQ(find_in_path("no-such-tool-gradebox", "/bin:/usr/bin"), std::nullopt);
    ASSERT_EQ(find_in_path("/bin/sh", ""), "/bin/sh");
    ASSERT_EQ(find_in_path("", "/bin"), std::nullopt);
    // Directories are not executables
    ASSERT_EQ(find_in_path("bin", "/"), std::nullopt);
}

// NOLINTNEXTLINE
TEST(environment, find_in_path_empty_entry_is_cwd) {
    TemporaryDirectory tmp_dir{"/tmp/gradebox_test.XXXXXX"};
    auto tool = tmp_dir.path() + "/tool";
    put_file_contents(tool, "#!/bin/sh\n");
    ASSERT_EQ(chmod(tool.c_str(), 0755), 0);
    char cwd[4096];
    ASSERT_NE(getcwd(cwd, sizeof(cwd)), nullptr);
    ASSERT_EQ(chdir(tmp_dir.path().c_str()), 0);
    auto found = find_in_path("tool", "/nonexistent::/bin");
    ASSERT_EQ(chdir(cwd), 0);
    ASSERT_EQ(found, "tool");
}

// NOLINTNEXTLINE
TEST(environment, tools) {
    auto report = gradebox::check_environment({
        .run_user = std::nullopt,
        .required_tools = {"sh", "no-such-tool-gradebox"},
        .grade_executable = "/bin/sh",
        .path_env = "/bin:/usr/bin",
    });
    ASSERT_FALSE(report.ok());
    ASSERT_EQ(find_check(report, "tool sh").status, Status::OK);
    ASSERT_EQ(find_check(report, "tool no-such-tool-gradebox").status, Status::FAILED);
    ASSERT_NE(report.to_string().find("[FAILED] tool no-such-tool-gradebox: not found in PATH\n"),
              std::string::npos);
}

// NOLINTNEXTLINE
TEST(environment, grade_executable) {
    TemporaryDirectory tmp_dir{"/tmp/gradebox_test.XXXXXX"};
    auto exe = tmp_dir.path() + "/grade";
    put_file_contents(exe, "#!/bin/sh\n");
    auto check_exe = [&] {
        auto report = gradebox::check_environment({
            .run_user = std::nullopt,
            .required_tools = {},
            .grade_executable = exe,
            .path_env = "/bin",
        });
        return find_check(report, "grade executable");
    };

    ASSERT_EQ(chmod(exe.c_str(), 0755), 0);
    ASSERT_EQ(check_exe().status, Status::OK);

    ASSERT_EQ(chmod(exe.c_str(), 0777), 0);
    auto check = check_exe();
    ASSERT_EQ(check.status, Status::WARNING);
    ASSERT_NE(check.message.find("world-writable"), std::string::npos);

    ASSERT_EQ(chmod(exe.c_str(), 0644), 0);
    ASSERT_EQ(check_exe().status, Status::FAILED);

    exe += ".missing";
    ASSERT_EQ(check_exe().status, Status::FAILED);
}

// NOLINTNEXTLINE
TEST(environment, default_identity_and_run_user) {
    auto report = gradebox::check_environment({
        .run_user = "no-such-user-gradebox",
        .required_tools = {},
        .grade_executable = "/bin/sh",
        .path_env = "/bin",
    });
    ASSERT_EQ(find_check(report, "run user").status, Status::FAILED);
    ASSERT_EQ(
        find_check(report, "default identity").status,
        geteuid() == 0 ? Status::FAILED : Status::OK
    );

    report = gradebox::check_environment({
        .run_user = "nobody",
        .required_tools = {},
        .grade_executable = "/bin/sh",
        .path_env = "/bin",
    });
    ASSERT_EQ(find_check(report, "run user").status, Status::OK);
    ASSERT_EQ(
        find_check(report, "default identity").status,
        geteuid() == 0 ? Status::WARNING : Status::OK
    );
}
