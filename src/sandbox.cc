#include "gradebox/concat_tostr.hh"
#include "gradebox/debug.hh"
#include "gradebox/errmsg.hh"
#include "gradebox/file_contents.hh"
#include "gradebox/file_descriptor.hh"
#include "gradebox/macros/throw.hh"
#include "gradebox/sandbox.hh"
#include "gradebox/syscalls.hh"
#include "sandbox_tracee.hh"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <poll.h>
#include <sys/mman.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <unistd.h>

using std::chrono::steady_clock;

namespace {

constexpr DebugLogger<false> debuglog{};

std::chrono::nanoseconds to_nanoseconds(const timeval& tv) noexcept {
    return std::chrono::seconds{tv.tv_sec} + std::chrono::microseconds{tv.tv_usec};
}

} // namespace

namespace sandbox {

std::string Si::description() const {
    auto signal_description = [](const char* prefix, int signum) {
        const auto* abbrv = sigabbrev_np(signum);
        const auto* descr = sigdescr_np(signum);
        if (abbrv) {
            if (descr) {
                return concat_tostr(prefix, ' ', abbrv, " - ", descr);
            }
            return concat_tostr(prefix, ' ', abbrv);
        }
        if (descr) {
            return concat_tostr(prefix, " with number ", signum, " - ", descr);
        }
        return concat_tostr(prefix, " with number ", signum);
    };
    switch (code) {
    case CLD_EXITED: return concat_tostr("exited with ", status);
    case CLD_KILLED: return signal_description("killed by signal", status);
    case CLD_DUMPED: return signal_description("killed and dumped by signal", status);
    case CLD_TRAPPED: return signal_description("trapped by signal", status);
    case CLD_STOPPED: return signal_description("stopped by signal", status);
    case CLD_CONTINUED: return signal_description("continued by signal", status);
    }
    return "unable to describe";
}

future execute(const Options& options) {
    if (options.identity) {
        if (options.identity->uid == 0) {
            THROW("refusing to run \"", options.executable, "\" as uid 0");
        }
        if (geteuid() != 0) {
            THROW("switching to user \"", options.identity->name, "\" requires root");
        }
    } else if (geteuid() == 0) {
        THROW("Sandbox is not secure if run as root/sudo without an identity to switch to");
    }

    FileDescriptor error_fd{memfd_create("sandbox errors", MFD_CLOEXEC)};
    if (not error_fd.is_open()) {
        THROW("memfd_create()", errmsg());
    }

    const auto parent_pid = getpid();
    int child_pidfd = -1;
    clone_args cl_args = {
        .flags = CLONE_PIDFD,
        .pidfd = reinterpret_cast<uintptr_t>(&child_pidfd),
        .exit_signal = SIGCHLD,
    };
    const auto start_time = steady_clock::now();
    auto pid = syscalls::clone3(&cl_args);
    if (pid == -1) {
        THROW("clone3()", errmsg());
    }
    if (pid == 0) {
        tracee::execute(options, std::move(error_fd), parent_pid);
        __builtin_unreachable();
    }
    // Parent process
    debuglog("spawned [", pid, "]: ", options.executable);
    std::optional<steady_clock::time_point> deadline;
    if (options.limits.real_time) {
        deadline = start_time +
            std::chrono::duration_cast<steady_clock::duration>(*options.limits.real_time);
    }
    return {pid, FileDescriptor{child_pidfd}, std::move(error_fd), start_time, deadline};
}

void future::kill() noexcept {
    if (not pidfd_.is_open()) {
        return;
    }
    debuglog("kill [", pid, "] and its process group");
    // The tracee might not have called setpgid() yet
    (void)syscalls::pidfd_send_signal(pidfd_, SIGKILL, nullptr, 0);
    (void)::kill(-pid, SIGKILL);
}

Result future::get() {
    if (not pidfd_.is_open()) {
        THROW("future already retrieved");
    }
    Result res{};
    if (deadline_) {
        for (;;) {
            auto now = steady_clock::now();
            if (now >= *deadline_) {
                pollfd pfd = {.fd = pidfd_, .events = POLLIN, .revents = 0};
                if (poll(&pfd, 1, 0) == 0) {
                    debuglog("[", pid, "] real time limit expired");
                    kill();
                    res.killed_by_time_limit = true;
                }
                break;
            }
            auto timeout =
                std::chrono::ceil<std::chrono::milliseconds>(*deadline_ - now).count();
            pollfd pfd = {.fd = pidfd_, .events = POLLIN, .revents = 0};
            int rc = poll(&pfd, 1, static_cast<int>(std::min<int64_t>(timeout, INT32_MAX)));
            if (rc == -1) {
                if (errno == EINTR) {
                    continue;
                }
                THROW("poll()", errmsg());
            }
            if (rc == 1) {
                break; // the root process exited
            }
        }
    }

    siginfo_t si{};
    rusage ru{};
    while (syscalls::waitid(syscalls::P_PIDFD_IDTYPE, pidfd_, &si, WEXITED, &ru)) {
        if (errno != EINTR) {
            THROW("waitid()", errmsg());
        }
    }
    res.runtime = steady_clock::now() - start_time;
    (void)pidfd_.close();
    debuglog.verbose(
        "waitid([", pid, "]) = {code: ", si.si_code, ", status: ", si.si_status, "}");
    // Kill the processes left in the process group. The group id cannot be reused while the
    // group has members.
    if (::kill(-pid, SIGKILL) and errno != ESRCH) {
        THROW("kill(-", pid, ")", errmsg());
    }

    res.si = {.code = si.si_code, .status = si.si_status};
    res.cpu_runtime = to_nanoseconds(ru.ru_utime) + to_nanoseconds(ru.ru_stime);
    res.peak_memory_in_bytes = static_cast<uint64_t>(ru.ru_maxrss) * 1024;

    // Receive the setup error, if any
    off_t pos = lseek(error_fd, 0, SEEK_CUR);
    if (pos == -1) {
        THROW("lseek()", errmsg());
    }
    if (pos > 0) {
        std::string msg(static_cast<size_t>(pos), '\0');
        if (pread_all(error_fd, 0, msg.data(), msg.size()) != msg.size()) {
            THROW("read()", errmsg());
        }
        (void)error_fd.close();
        throw SetupError{
            msg,
            si.si_code == CLD_EXITED and si.si_status == tracee::EXECUTABLE_NOT_FOUND_EXIT_CODE};
    }
    (void)error_fd.close(); // Not needed anymore
    return res;
}

future::~future() {
    if (not pidfd_.is_open()) {
        return;
    }
    kill();
    siginfo_t si{};
    while (syscalls::waitid(syscalls::P_PIDFD_IDTYPE, pidfd_, &si, WEXITED, nullptr) and
           errno == EINTR)
    {
    }
    // The root process is reaped, nothing else can be done in a destructor
}

} // namespace sandbox
