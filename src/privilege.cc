#include "gradebox/errmsg.hh"
#include "gradebox/macros/throw.hh"
#include "gradebox/privilege.hh"

#include <grp.h>
#include <linux/securebits.h>
#include <pwd.h>
#include <sys/capability.h>
#include <sys/prctl.h>
#include <unistd.h>
#include <vector>

namespace {

std::optional<gradebox::Identity> find_passwd_entry(const char* name, uid_t uid) {
    auto bufsize = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buff(bufsize > 0 ? static_cast<size_t>(bufsize) : 1 << 14);
    passwd pwd{};
    passwd* res = nullptr;
    int rc = name ? getpwnam_r(name, &pwd, buff.data(), buff.size(), &res)
                  : getpwuid_r(uid, &pwd, buff.data(), buff.size(), &res);
    if (rc) {
        THROW(name ? "getpwnam_r()" : "getpwuid_r()", errmsg(rc));
    }
    if (res == nullptr) {
        return std::nullopt;
    }
    return gradebox::Identity{
        .uid = pwd.pw_uid,
        .gid = pwd.pw_gid,
        .name = pwd.pw_name,
        .home = pwd.pw_dir,
    };
}

} // namespace

namespace gradebox {

Identity lookup_user(std::string_view name) {
    auto name_str = std::string{name};
    auto identity = find_passwd_entry(name_str.c_str(), 0);
    if (not identity) {
        THROW("user \"", name, "\" does not exist");
    }
    return std::move(*identity);
}

Identity current_identity() {
    auto euid = geteuid();
    auto identity = find_passwd_entry(nullptr, euid);
    if (not identity) {
        return {.uid = euid, .gid = getegid(), .name = {}, .home = {}};
    }
    identity->gid = getegid();
    return std::move(*identity);
}

std::optional<Identity>
resolve_run_identity(uid_t euid, const std::optional<std::string>& requested_user) {
    if (euid != 0) {
        if (not requested_user) {
            return std::nullopt;
        }
        auto identity = lookup_user(*requested_user);
        if (identity.uid != euid) {
            THROW(
                "cannot run submissions as \"", *requested_user,
                "\": switching user requires running as root");
        }
        return std::nullopt; // already running as that user
    }

    auto identity = lookup_user(requested_user ? *requested_user : DEFAULT_RUN_USER);
    if (identity.uid == 0) {
        THROW("refusing to run submissions as \"", identity.name, "\" (uid 0)");
    }
    return identity;
}

std::optional<PrivilegeDropError> drop_privileges(const Identity& identity) noexcept {
    if (identity.uid == 0) {
        return PrivilegeDropError{"dropping privileges to uid 0", 0};
    }
    // Secure bits have to be set while we still have CAP_SETPCAP
    if (cap_set_secbits(
            SECBIT_NOROOT | SECBIT_NOROOT_LOCKED | SECBIT_NO_CAP_AMBIENT_RAISE |
            SECBIT_NO_CAP_AMBIENT_RAISE_LOCKED))
    {
        return PrivilegeDropError{"cap_set_secbits()", errno};
    }
    if (setgroups(1, &identity.gid)) {
        return PrivilegeDropError{"setgroups()", errno};
    }
    if (setresgid(identity.gid, identity.gid, identity.gid)) {
        return PrivilegeDropError{"setresgid()", errno};
    }
    if (setresuid(identity.uid, identity.uid, identity.uid)) {
        return PrivilegeDropError{"setresuid()", errno};
    }
    if (auto err = drop_capabilities()) {
        return err;
    }
    // Verify the drop
    if (setuid(0) == 0 or setgid(0) == 0) {
        return PrivilegeDropError{"regaining root succeeded after dropping privileges", 0};
    }
    if (geteuid() != identity.uid or getegid() != identity.gid) {
        return PrivilegeDropError{"identity did not change after dropping privileges", 0};
    }
    return std::nullopt;
}

std::optional<PrivilegeDropError> drop_capabilities() noexcept {
    cap_t caps = cap_init();
    if (caps == nullptr) {
        return PrivilegeDropError{"cap_init()", errno};
    }
    if (cap_clear(caps)) {
        int errnum = errno;
        (void)cap_free(caps);
        return PrivilegeDropError{"cap_clear()", errnum};
    }
    if (cap_set_proc(caps)) {
        int errnum = errno;
        (void)cap_free(caps);
        return PrivilegeDropError{"cap_set_proc()", errnum};
    }
    if (cap_free(caps)) {
        return PrivilegeDropError{"cap_free()", errno};
    }
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0)) {
        return PrivilegeDropError{"prctl(PR_SET_NO_NEW_PRIVS)", errno};
    }
    return std::nullopt;
}

} // namespace gradebox
