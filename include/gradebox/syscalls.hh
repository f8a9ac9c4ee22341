#pragma once

#include <csignal>
#include <linux/sched.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Raw system calls that glibc does not wrap (or wraps without all the arguments)
namespace syscalls {

// idtype_t value for waitid() that waits on a pidfd (glibc < 2.36 does not name it)
constexpr int P_PIDFD_IDTYPE = 3;

inline pid_t clone3(clone_args* cl_args) noexcept {
    return static_cast<pid_t>(syscall(SYS_clone3, cl_args, sizeof(*cl_args)));
}

// Unlike the glibc wrapper, it also fills @p ru
inline int waitid(int idtype, id_t id, siginfo_t* infop, int options, rusage* ru) noexcept {
    return static_cast<int>(syscall(SYS_waitid, idtype, id, infop, options, ru));
}

inline int
pidfd_send_signal(int pidfd, int sig, siginfo_t* info, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_send_signal, pidfd, sig, info, flags));
}

inline int close_range(unsigned int first, unsigned int last, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_close_range, first, last, flags));
}

} // namespace syscalls
