#pragma once

#include "gradebox/file_descriptor.hh"
#include "gradebox/privilege.hh"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

namespace sandbox {

struct Options {
    struct NewIOFileDescriptors {
        int stdin = STDIN_FILENO; // if negative, use /dev/null
        int stdout = STDOUT_FILENO; // if negative, use /dev/null
        int stderr = STDERR_FILENO; // if negative, use /dev/null
    } new_io_fds;

    struct Limits {
        // Real time limit for the root process; on expiry the whole process group is killed
        std::optional<std::chrono::nanoseconds> real_time;
        // CPU time limit (RLIMIT_CPU, rounded up to whole seconds); if not set, and real time
        // limit is set, then CPU time limit will be set to ceil(real time limit in seconds) + 1
        std::optional<std::chrono::nanoseconds> cpu_time;
        // Memory limit in bytes, will be rounded down to system page size; limits virtual
        // memory size of each process
        std::optional<uint64_t> memory_limit;
        std::optional<uint64_t> stack_size_limit; // in bytes
        // Maximum size of a file the processes may create or extend, in bytes
        std::optional<uint64_t> file_size_limit;
        // Maximum number of processes of the executing user (RLIMIT_NPROC)
        std::optional<unsigned> max_processes;
    } limits;

    // Identity to switch to before executing; required if the caller runs as root
    std::optional<gradebox::Identity> identity;

    // Directory to execute in; it is entered before dropping privileges. Empty means the
    // current working directory.
    std::string working_dir;

    // Environment as "NAME=value" strings; if empty, then PATH, HOME, USER and LANG are set
    std::vector<std::string> env;

    // Path to the program to run; if it contains no '/', it is searched for in PATH of env
    std::string executable;
    std::vector<std::string> args; // executable args (same as for execve())
};

struct Si {
    int code; // siginfo_t::si_code from waitid() of the root process
    int status; // siginfo_t::si_status from waitid() of the root process

    bool operator==(const Si&) const noexcept = default;

    // Returns textual description e.g. "exited with 1" or "killed by signal SEGV -
    // Segmentation fault"
    [[nodiscard]] std::string description() const;
};

struct Result {
    Si si{};

    // Runtime (real time) of the root process
    std::chrono::nanoseconds runtime{0};
    // CPU time of the root process and its waited descendants
    std::chrono::nanoseconds cpu_runtime{0};
    // Peak resident set size of the root process and its waited descendants (in bytes)
    uint64_t peak_memory_in_bytes = 0;
    // Whether the process group was killed because the real time limit expired
    bool killed_by_time_limit = false;
};

// Error that occurred in the child process before the executable was run
class SetupError : public std::runtime_error {
    bool executable_not_found_;

public:
    SetupError(const std::string& msg, bool executable_not_found)
    : std::runtime_error{msg}
    , executable_not_found_{executable_not_found} {}

    [[nodiscard]] bool executable_not_found() const noexcept { return executable_not_found_; }
};

class future {
    pid_t pid;
    FileDescriptor pidfd_;
    FileDescriptor error_fd;
    std::chrono::steady_clock::time_point start_time;
    std::optional<std::chrono::steady_clock::time_point> deadline_;

    future(
        pid_t pid,
        FileDescriptor pidfd,
        FileDescriptor error_fd,
        std::chrono::steady_clock::time_point start_time,
        std::optional<std::chrono::steady_clock::time_point> deadline
    ) noexcept
    : pid{pid}
    , pidfd_{std::move(pidfd)}
    , error_fd{std::move(error_fd)}
    , start_time{start_time}
    , deadline_{deadline} {}

public:
    future(const future&) = delete;
    future(future&&) noexcept = default;
    future& operator=(const future&) = delete;
    future& operator=(future&&) noexcept = default;

    // Not retrieved future kills and reaps the process group
    ~future();

    // Becomes readable once the root process exits; -1 if the result was retrieved
    [[nodiscard]] int pidfd() const noexcept { return pidfd_; }

    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> deadline() const noexcept {
        return deadline_;
    }

    // Kills the root process and its process group
    void kill() noexcept;

    // Waits for the root process (killing the process group when the real time limit expires),
    // reaps it and kills the rest of its process group. Throws SetupError if the executable
    // could not be run and std::runtime_error on other errors.
    Result get();

    friend future execute(const Options& options);
};

// Runs options.executable in a new process group, with the limits and the identity from
// @p options. Throws on error.
future execute(const Options& options);

} // namespace sandbox
