#pragma once

#include "gradebox/privilege.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

constexpr std::string_view DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";

// Returns the first executable file named @p name in the ':'-separated list of directories
// @p path_env. Empty entries denote the current directory. Executability is checked for the
// real uid of the calling process.
std::optional<std::string> find_in_path(std::string_view name, std::string_view path_env);

struct EnvironmentCheckOptions {
    // User meant to run submissions (see resolve_run_identity())
    std::optional<std::string> run_user;
    std::vector<std::string> required_tools = {"cc", "make", "python3"};
    std::string grade_executable = "/usr/local/bin/grade";
    std::string path_env{DEFAULT_PATH};
};

struct CheckResult {
    enum class Status : uint8_t {
        OK,
        WARNING,
        FAILED,
    } status;

    std::string name;
    std::string message;
};

struct EnvironmentReport {
    std::vector<CheckResult> checks;

    // True iff no check failed
    [[nodiscard]] bool ok() const noexcept;

    // One line per check
    [[nodiscard]] std::string to_string() const;
};

std::string_view to_string(CheckResult::Status status) noexcept;

// Smoke checks of the grading environment: the default identity is not the superuser, the
// run user exists, required tools are on the search path, and the grading executable is
// executable (and not writable by everyone)
EnvironmentReport check_environment(const EnvironmentCheckOptions& options);

} // namespace gradebox
