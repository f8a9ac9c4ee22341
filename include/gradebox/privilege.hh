#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace gradebox {

// Account under which a process runs
struct Identity {
    uid_t uid;
    gid_t gid;
    std::string name;
    std::string home;
};

// User that runs submissions when grading is started by root
constexpr std::string_view DEFAULT_RUN_USER = "grader";

// Throws if user @p name does not exist
Identity lookup_user(std::string_view name);

// Effective identity of the calling process; name and home are empty if the uid has no
// passwd entry
Identity current_identity();

// Decides under which identity the submissions are run:
// - root without @p requested_user drops to DEFAULT_RUN_USER,
// - root with @p requested_user drops to that user,
// - non-root without @p requested_user keeps its identity (std::nullopt is returned),
// - non-root requesting any other user than itself is an error, as is every identity with
//   uid 0.
// Throws on error.
std::optional<Identity>
resolve_run_identity(uid_t euid, const std::optional<std::string>& requested_user);

struct PrivilegeDropError {
    std::string_view operation; // failed operation
    int errnum; // 0 if the failure did not come from a system call
};

// Irreversibly switches the calling process to @p identity. Requires root. Locks secure
// bits, so that regaining root does not regain capabilities, sets supplementary groups,
// gid and uid, then drops all capabilities (see drop_capabilities()) and checks that uid 0
// cannot be regained. Meant to be called in a child process before exec.
std::optional<PrivilegeDropError> drop_privileges(const Identity& identity) noexcept;

// Clears all capability sets of the calling process and sets no_new_privs, so that neither
// the process nor the programs it executes may gain privileges.
std::optional<PrivilegeDropError> drop_capabilities() noexcept;

} // namespace gradebox
