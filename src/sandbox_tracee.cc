#include "gradebox/concat_tostr.hh"
#include "gradebox/environment.hh"
#include "gradebox/errmsg.hh"
#include "gradebox/file_contents.hh"
#include "gradebox/file_descriptor.hh"
#include "gradebox/privilege.hh"
#include "gradebox/sandbox.hh"
#include "gradebox/string_traits.hh"
#include "gradebox/syscalls.hh"
#include "sandbox_tracee.hh"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdint>
#include <exception>
#include <fcntl.h>
#include <optional>
#include <string>
#include <string_view>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <unistd.h>
#include <vector>

using sandbox::tracee::EXECUTABLE_NOT_FOUND_EXIT_CODE;
using sandbox::tracee::SETUP_ERROR_EXIT_CODE;

namespace {

struct Tracee {
    const sandbox::Options& options;
    FileDescriptor error_fd;

    // tricks to allow noexcept constructor
    std::optional<std::vector<std::string>> env_holder;
    std::optional<std::vector<const char*>> argv_holder;
    std::optional<std::vector<const char*>> envp_holder;
    std::optional<std::string> executable_path;

    template <class... Args>
    // NOLINTNEXTLINE(readability-make-member-function-const)
    [[noreturn]] void die_with_code(int exit_code, const Args&... args) noexcept {
        static_assert(sizeof...(Args) > 0, "error message cannot be empty");
        try {
            auto msg = concat_tostr(args...);
            (void)write_all(error_fd, msg);
        } catch (const std::exception&) {
            (void)write_all(error_fd, "out of memory while reporting an error");
        }
        _exit(exit_code);
    }

    template <class... Args>
    [[noreturn]] void die(const Args&... args) noexcept {
        die_with_code(SETUP_ERROR_EXIT_CODE, args...);
    }

    template <class... Args>
    void die_if_err(bool failed, const Args&... args) noexcept {
        static_assert(
            sizeof...(Args) > 0, "Description of the cause of an error is necessary");
        if (failed) {
            die(args..., errmsg());
        }
    }

    void initialize() noexcept {
        // New process name
        die_if_err(prctl(PR_SET_NAME, "sandbox", 0, 0, 0), "prctl(PR_SET_NAME)");
        // The caller kills the whole group on timeout
        die_if_err(setpgid(0, 0), "setpgid()");
        // Move error_fd out of the way of the standard streams
        int fd = fcntl(error_fd, F_DUPFD_CLOEXEC, 3);
        die_if_err(fd == -1, "fcntl(F_DUPFD_CLOEXEC)");
        error_fd = fd;
    }

    void setup_io() noexcept {
        const std::array<int, 3> new_fds = {
            options.new_io_fds.stdin,
            options.new_io_fds.stdout,
            options.new_io_fds.stderr,
        };
        // Duplicate first, so that dup2() below does not overwrite any source fd
        std::array<FileDescriptor, 3> sources;
        for (size_t i = 0; i < new_fds.size(); ++i) {
            if (new_fds[i] < 0) {
                sources[i] = open("/dev/null", (i == 0 ? O_RDONLY : O_WRONLY) | O_CLOEXEC);
                die_if_err(not sources[i].is_open(), "open(/dev/null)");
            } else {
                sources[i] = fcntl(new_fds[i], F_DUPFD_CLOEXEC, 3);
                die_if_err(not sources[i].is_open(), "fcntl(F_DUPFD_CLOEXEC)");
            }
        }
        for (size_t i = 0; i < new_fds.size(); ++i) {
            die_if_err(dup2(sources[i], static_cast<int>(i)) == -1, "dup2()");
        }
    }

    void close_other_fds() noexcept {
        auto first = static_cast<unsigned>(STDERR_FILENO + 1);
        auto err_fd = static_cast<unsigned>(static_cast<int>(error_fd));
        auto close_range = [&](unsigned from, unsigned to) noexcept {
            if (from > to) {
                return;
            }
            if (syscalls::close_range(from, to, 0) == 0) {
                return;
            }
            die_if_err(errno != ENOSYS, "close_range()");
            // Kernel older than 5.9
            rlimit rlim{};
            die_if_err(getrlimit(RLIMIT_NOFILE, &rlim), "getrlimit(RLIMIT_NOFILE)");
            auto last = rlim.rlim_cur == RLIM_INFINITY ? 1U << 20
                                                       : static_cast<unsigned>(rlim.rlim_cur);
            for (auto fd = from; fd <= to and fd < last; ++fd) {
                (void)close(static_cast<int>(fd));
            }
        };
        close_range(first, err_fd - 1);
        close_range(err_fd + 1, UINT_MAX);
    }

    void change_working_dir() noexcept {
        if (not options.working_dir.empty()) {
            die_if_err(chdir(options.working_dir.c_str()), "chdir(", options.working_dir, ")");
        }
    }

    void set_rlimit(int resource, rlim_t soft, rlim_t hard, std::string_view name) noexcept {
        rlimit rlim = {
            .rlim_cur = soft,
            .rlim_max = hard,
        };
        die_if_err(setrlimit(resource, &rlim), "setrlimit(", name, ")");
    }

    void set_limits() noexcept {
        const auto& limits = options.limits;
        set_rlimit(RLIMIT_CORE, 0, 0, "RLIMIT_CORE");

        auto cpu_time = limits.cpu_time;
        if (not cpu_time and limits.real_time) {
            cpu_time = std::chrono::ceil<std::chrono::seconds>(*limits.real_time) +
                std::chrono::seconds{1};
        }
        if (cpu_time) {
            // SIGXCPU at the soft limit, SIGKILL at the hard one
            auto secs = static_cast<rlim_t>(
                std::max<int64_t>(std::chrono::ceil<std::chrono::seconds>(*cpu_time).count(), 1)
            );
            set_rlimit(RLIMIT_CPU, secs, secs + 1, "RLIMIT_CPU");
        }
        if (limits.memory_limit) {
            static const auto page_size = static_cast<uint64_t>(sysconf(_SC_PAGESIZE));
            auto mem = *limits.memory_limit / page_size * page_size;
            set_rlimit(RLIMIT_AS, mem, mem, "RLIMIT_AS");
        }
        if (limits.stack_size_limit) {
            set_rlimit(
                RLIMIT_STACK, *limits.stack_size_limit, *limits.stack_size_limit, "RLIMIT_STACK"
            );
        }
        if (limits.file_size_limit) {
            set_rlimit(
                RLIMIT_FSIZE, *limits.file_size_limit, *limits.file_size_limit, "RLIMIT_FSIZE"
            );
        }
        if (limits.max_processes) {
            set_rlimit(
                RLIMIT_NPROC, *limits.max_processes, *limits.max_processes, "RLIMIT_NPROC"
            );
        }
    }

    void drop_privileges() noexcept {
        auto err =
            options.identity ? gradebox::drop_privileges(*options.identity)
                             : gradebox::drop_capabilities();
        if (err) {
            if (err->errnum == 0) {
                die(err->operation);
            }
            die(err->operation, errmsg(err->errnum));
        }
        uid_t ruid{}, euid{}, suid{};
        die_if_err(getresuid(&ruid, &euid, &suid), "getresuid()");
        if (ruid == 0 or euid == 0 or suid == 0) {
            die("Sandbox is not secure if run as root/sudo");
        }
    }

    void set_parent_death_signal(pid_t parent_pid) noexcept {
        // Changing credentials clears the parent death signal, so it is set afterwards
        die_if_err(prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0), "prctl(PR_SET_PDEATHSIG)");
        // Ensure our parent did not die before we set PR_SET_PDEATHSIG
        if (getppid() != parent_pid) {
            die("creator of the sandbox process died");
        }
    }

    void reset_signals() noexcept {
        // Reset blocked signals
        sigset_t sigset;
        die_if_err(sigemptyset(&sigset), "sigemptyset()");
        die_if_err(sigprocmask(SIG_SETMASK, &sigset, nullptr), "sigprocmask()");
        // Ignored signals stay ignored across execve()
        struct sigaction sa {};
        sa.sa_handler = SIG_DFL;
        for (int sig : {SIGPIPE, SIGXCPU, SIGXFSZ, SIGINT, SIGQUIT, SIGTERM, SIGHUP}) {
            die_if_err(sigaction(sig, &sa, nullptr), "sigaction(", sig, ")");
        }
    }

    void prepare_env() noexcept {
        try {
            env_holder.emplace(options.env);
            if (env_holder->empty()) {
                auto identity =
                    options.identity ? *options.identity : gradebox::current_identity();
                env_holder->emplace_back(concat_tostr("PATH=", gradebox::DEFAULT_PATH));
                env_holder->emplace_back(
                    concat_tostr("HOME=", identity.home.empty() ? "/" : identity.home));
                env_holder->emplace_back(concat_tostr("USER=", identity.name));
                env_holder->emplace_back("LANG=C");
            }
            envp_holder.emplace();
            for (const auto& var : *env_holder) {
                envp_holder->emplace_back(var.c_str());
            }
            envp_holder->emplace_back(nullptr);
        } catch (const std::exception& e) {
            die("preparing environment: ", e.what());
        }
    }

    void prepare_argv() noexcept {
        try {
            argv_holder.emplace();
            for (const auto& arg : options.args) {
                argv_holder->emplace_back(arg.c_str());
            }
            argv_holder->emplace_back(nullptr);
        } catch (const std::exception& e) {
            die("preparing argv for execve(): ", e.what());
        }
    }

    void find_executable() noexcept {
        if (options.executable.find('/') != std::string::npos) {
            executable_path = options.executable;
            return;
        }
        std::string_view path_env = gradebox::DEFAULT_PATH;
        for (const auto& var : *env_holder) {
            if (has_prefix(var, "PATH=")) {
                path_env = std::string_view{var}.substr(5);
            }
        }
        try {
            // Searched for after dropping privileges, so that permissions of the run
            // identity apply
            executable_path = gradebox::find_in_path(options.executable, path_env);
        } catch (const std::exception& e) {
            die("searching for the executable: ", e.what());
        }
        if (not executable_path) {
            die_with_code(
                EXECUTABLE_NOT_FOUND_EXIT_CODE, "command not found: ", options.executable
            );
        }
    }

    [[noreturn]] void execute() noexcept {
        execve(
            executable_path->c_str(), const_cast<char* const*>(argv_holder->data()),
            const_cast<char* const*>(envp_holder->data())
        );
        int errnum = errno;
        if (errnum == ENOENT) {
            die_with_code(
                EXECUTABLE_NOT_FOUND_EXIT_CODE, "execve(", *executable_path, ")", errmsg(errnum)
            );
        }
        die("execve(", *executable_path, ")", errmsg(errnum));
    }
};

} // namespace

namespace sandbox::tracee {

void execute(const Options& options, FileDescriptor error_fd, pid_t parent_pid) noexcept {
    Tracee tra = {
        .options = options,
        .error_fd = std::move(error_fd),
        .env_holder = std::nullopt,
        .argv_holder = std::nullopt,
        .envp_holder = std::nullopt,
        .executable_path = std::nullopt,
    };
    tra.initialize();
    tra.setup_io();
    tra.close_other_fds();
    tra.change_working_dir();
    tra.set_limits();
    tra.prepare_env(); // before dropping privileges, current_identity() may need NSS files
    tra.drop_privileges();
    tra.set_parent_death_signal(parent_pid);
    tra.reset_signals();
    tra.prepare_argv();
    tra.find_executable();
    tra.execute();
}

} // namespace sandbox::tracee
