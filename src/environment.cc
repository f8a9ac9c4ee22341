#include "gradebox/concat_tostr.hh"
#include "gradebox/environment.hh"
#include "gradebox/errmsg.hh"

#include <exception>
#include <sys/stat.h>
#include <unistd.h>

namespace {

using gradebox::CheckResult;
using Status = CheckResult::Status;

bool is_executable_file(const std::string& path) noexcept {
    struct stat st {};
    return stat(path.c_str(), &st) == 0 and S_ISREG(st.st_mode) and
        access(path.c_str(), X_OK) == 0;
}

CheckResult check_default_identity(const gradebox::EnvironmentCheckOptions& options) {
    auto self = gradebox::current_identity();
    auto who = concat_tostr(self.name.empty() ? "<no passwd entry>" : self.name, " (uid ",
                            self.uid, ')');
    if (self.uid != 0) {
        return {Status::OK, "default identity", concat_tostr("running as ", who)};
    }
    try {
        auto run_identity = gradebox::resolve_run_identity(0, options.run_user);
        return {
            Status::WARNING, "default identity",
            concat_tostr("running as ", who, "; submissions will run as ", run_identity->name,
                         " (uid ", run_identity->uid, ')')};
    } catch (const std::exception& e) {
        return {Status::FAILED, "default identity",
                concat_tostr("running as the superuser and no unprivileged run user is "
                             "available: ",
                             e.what())};
    }
}

CheckResult check_run_user(const gradebox::EnvironmentCheckOptions& options) {
    if (not options.run_user) {
        return {Status::OK, "run user", "not configured, the default identity is used"};
    }
    try {
        auto identity = gradebox::lookup_user(*options.run_user);
        if (identity.uid == 0) {
            return {Status::FAILED, "run user",
                    concat_tostr('"', identity.name, "\" has uid 0")};
        }
        return {Status::OK, "run user",
                concat_tostr(identity.name, " (uid ", identity.uid, ", gid ", identity.gid,
                             ')')};
    } catch (const std::exception& e) {
        return {Status::FAILED, "run user", e.what()};
    }
}

CheckResult check_tool(const std::string& tool, std::string_view path_env) {
    auto name = concat_tostr("tool ", tool);
    if (auto path = gradebox::find_in_path(tool, path_env)) {
        return {Status::OK, name, *path};
    }
    return {Status::FAILED, name, "not found in PATH"};
}

CheckResult check_grade_executable(const std::string& path) {
    struct stat st {};
    if (stat(path.c_str(), &st)) {
        return {Status::FAILED, "grade executable", concat_tostr(path, errmsg())};
    }
    if (not S_ISREG(st.st_mode) or access(path.c_str(), X_OK) != 0) {
        return {Status::FAILED, "grade executable",
                concat_tostr(path, " is not executable by the default identity")};
    }
    if (st.st_mode & S_IWOTH) {
        return {Status::WARNING, "grade executable",
                concat_tostr(path, " is world-writable, any user can replace it")};
    }
    return {Status::OK, "grade executable", path};
}

} // namespace

namespace gradebox {

std::optional<std::string> find_in_path(std::string_view name, std::string_view path_env) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string_view::npos) {
        auto path = std::string{name};
        return is_executable_file(path) ? std::optional{path} : std::nullopt;
    }
    for (;;) {
        auto colon = path_env.find(':');
        auto dir = path_env.substr(0, colon);
        auto candidate = dir.empty() ? std::string{name} : concat_tostr(dir, '/', name);
        if (is_executable_file(candidate)) {
            return candidate;
        }
        if (colon == std::string_view::npos) {
            return std::nullopt;
        }
        path_env.remove_prefix(colon + 1);
    }
}

bool EnvironmentReport::ok() const noexcept {
    for (const auto& check : checks) {
        if (check.status == CheckResult::Status::FAILED) {
            return false;
        }
    }
    return true;
}

std::string EnvironmentReport::to_string() const {
    std::string res;
    for (const auto& check : checks) {
        res += concat_tostr(
            '[', gradebox::to_string(check.status), "] ", check.name, ": ", check.message, '\n');
    }
    return res;
}

std::string_view to_string(CheckResult::Status status) noexcept {
    switch (status) {
    case CheckResult::Status::OK: return "OK";
    case CheckResult::Status::WARNING: return "WARNING";
    case CheckResult::Status::FAILED: return "FAILED";
    }
    return "?";
}

EnvironmentReport check_environment(const EnvironmentCheckOptions& options) {
    EnvironmentReport report;
    report.checks.emplace_back(check_default_identity(options));
    report.checks.emplace_back(check_run_user(options));
    for (const auto& tool : options.required_tools) {
        report.checks.emplace_back(check_tool(tool, options.path_env));
    }
    report.checks.emplace_back(check_grade_executable(options.grade_executable));
    return report;
}

} // namespace gradebox
