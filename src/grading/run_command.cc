#include "gradebox/concat_tostr.hh"
#include "gradebox/errmsg.hh"
#include "gradebox/grading/run_command.hh"
#include "gradebox/macros/throw.hh"
#include "gradebox/pipe.hh"
#include "gradebox/sandbox.hh"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using std::chrono::steady_clock;

namespace {

struct CollectOutputRes {
    std::string output;
    bool output_limit_exceeded;
};

// Reads @p output_pipe until EOF, the deadline of @p fut, or until the output limit is
// exceeded (in the latter case the process group is killed). Once the root process exits, the
// rest of its process group is killed, so that no process keeps the pipe open.
CollectOutputRes collect_output(
    sandbox::future& fut, FileDescriptor& output_pipe, uint64_t output_limit_in_bytes
) {
    enum {
        OUTPUT_PIPE = 0,
        PIDFD = 1,
    };
    std::array<pollfd, 2> pfds;
    pfds[OUTPUT_PIPE] = {
        .fd = output_pipe,
        .events = POLLIN,
        .revents = 0,
    };
    pfds[PIDFD] = {
        .fd = fut.pidfd(),
        .events = POLLIN,
        .revents = 0,
    };

    CollectOutputRes res{
        .output = {},
        .output_limit_exceeded = false,
    };
    auto close_output = [&] {
        if (output_pipe.close()) {
            THROW("close()", errmsg());
        }
        pfds[OUTPUT_PIPE].fd = -1;
    };

    while (pfds[OUTPUT_PIPE].fd >= 0) {
        int timeout_ms = -1;
        if (auto deadline = fut.deadline()) {
            auto now = steady_clock::now();
            if (now >= *deadline) {
                close_output(); // future::get() will kill the process group
                break;
            }
            timeout_ms = static_cast<int>(
                std::chrono::ceil<std::chrono::milliseconds>(*deadline - now).count());
        }
        for (auto& pfd : pfds) {
            pfd.revents = 0;
        }
        int rc = poll(pfds.data(), pfds.size(), timeout_ms);
        if (rc == 0 or (rc == -1 and errno == EINTR)) {
            continue;
        }
        if (rc == -1) {
            THROW("poll()", errmsg());
        }

        if (pfds[PIDFD].revents & POLLIN) {
            // The root process exited, the others will not be waited for
            fut.kill();
            pfds[PIDFD].fd = -1;
        }

        if (pfds[OUTPUT_PIPE].revents & (POLLIN | POLLHUP | POLLERR)) {
            char buff[1 << 16];
            auto len = read(output_pipe, buff, sizeof(buff));
            if (len == -1) {
                if (errno == EAGAIN or errno == EINTR) {
                    continue;
                }
                THROW("read()", errmsg());
            }
            if (len == 0) {
                close_output();
                continue;
            }
            auto remaining = output_limit_in_bytes - res.output.size();
            if (static_cast<uint64_t>(len) > remaining) {
                res.output.append(buff, remaining);
                res.output_limit_exceeded = true;
                fut.kill();
                close_output();
                continue;
            }
            res.output.append(buff, static_cast<size_t>(len));
        }
    }
    return res;
}

std::string format_seconds(std::chrono::nanoseconds time) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time).count();
    if (ms % 1000 == 0) {
        return concat_tostr(ms / 1000, " s");
    }
    return concat_tostr(ms / 1000, '.', ms % 1000 / 100, ms % 100 / 10, ms % 10, " s");
}

} // namespace

namespace gradebox::grading {

std::string_view to_string(CommandReport::Status status) noexcept {
    using Status = CommandReport::Status;
    switch (status) {
    case Status::SetupError: return "SetupError";
    case Status::NotFound: return "NotFound";
    case Status::TimeLimitExceeded: return "TimeLimitExceeded";
    case Status::OutputLimitExceeded: return "OutputLimitExceeded";
    case Status::FileSizeLimitExceeded: return "FileSizeLimitExceeded";
    case Status::MemoryLimitExceeded: return "MemoryLimitExceeded";
    case Status::Signaled: return "Signaled";
    case Status::NonZeroExit: return "NonZeroExit";
    case Status::OK: return "OK";
    }
    return "?";
}

CommandReport run_command(const Command& command, const RunContext& ctx) {
    using Status = CommandReport::Status;
    if (command.empty()) {
        THROW("empty command");
    }
    static const auto page_size = static_cast<uint64_t>(sysconf(_SC_PAGESIZE));

    auto output_pipe = pipe2(O_CLOEXEC);
    if (not output_pipe) {
        THROW("pipe2()", errmsg());
    }

    sandbox::Options options;
    options.new_io_fds = {
        .stdin = ctx.stdin_fd,
        .stdout = output_pipe->writable,
        .stderr = output_pipe->writable,
    };
    options.limits = {
        .real_time = ctx.limits.time_limit,
        .cpu_time = std::nullopt,
        // + page_size to allow detecting overuse
        .memory_limit = ctx.limits.memory_limit_in_bytes
            ? std::optional{*ctx.limits.memory_limit_in_bytes + page_size}
            : std::nullopt,
        .stack_size_limit = std::nullopt,
        .file_size_limit = ctx.limits.file_size_limit_in_bytes,
        .max_processes = ctx.limits.max_processes,
    };
    options.identity = ctx.identity;
    options.working_dir = ctx.working_dir;
    options.executable = command.front();
    options.args = command;

    CommandReport report = {
        .status = Status::OK,
        .output = {},
        .result = std::nullopt,
        .comment = {},
    };

    auto fut = sandbox::execute(options);
    if (output_pipe->writable.close()) {
        THROW("close()", errmsg());
    }
    auto collected =
        collect_output(fut, output_pipe->readable, ctx.limits.output_limit_in_bytes);
    report.output = std::move(collected.output);

    sandbox::Result res;
    try {
        res = fut.get();
    } catch (const sandbox::SetupError& e) {
        report.status = e.executable_not_found() ? Status::NotFound : Status::SetupError;
        report.comment = e.what();
        return report;
    }
    report.result = res;

    auto killed_by = [&](int sig) {
        return (res.si.code == CLD_KILLED or res.si.code == CLD_DUMPED) and res.si.status == sig;
    };

    if (res.killed_by_time_limit or killed_by(SIGXCPU)) {
        report.status = Status::TimeLimitExceeded;
        report.comment =
            concat_tostr("time limit exceeded (", format_seconds(ctx.limits.time_limit), ')');
        return report;
    }
    if (collected.output_limit_exceeded) {
        report.status = Status::OutputLimitExceeded;
        report.comment = concat_tostr(
            "output size limit exceeded (", ctx.limits.output_limit_in_bytes, " bytes)");
        return report;
    }
    if (killed_by(SIGXFSZ)) {
        report.status = Status::FileSizeLimitExceeded;
        report.comment = "file size limit exceeded";
        return report;
    }
    bool exited_normally = res.si == sandbox::Si{.code = CLD_EXITED, .status = 0};
    if (not exited_normally and ctx.limits.memory_limit_in_bytes and
        res.peak_memory_in_bytes > *ctx.limits.memory_limit_in_bytes)
    {
        report.status = Status::MemoryLimitExceeded;
        report.comment = "memory limit exceeded";
        return report;
    }
    if (res.si.code == CLD_KILLED or res.si.code == CLD_DUMPED) {
        report.status = Status::Signaled;
        report.comment = res.si.description();
        return report;
    }
    if (not exited_normally) {
        report.status = Status::NonZeroExit;
        report.comment = res.si.description();
        return report;
    }
    return report;
}

std::string report_text(const CommandReport& report) {
    using Status = CommandReport::Status;
    switch (report.status) {
    case Status::OK:
    case Status::NonZeroExit: return report.output;
    case Status::NotFound: return concat_tostr("File not found: ", report.comment, '\n');
    case Status::SetupError:
        return concat_tostr("Failed to run the command: ", report.comment, '\n');
    case Status::TimeLimitExceeded:
    case Status::OutputLimitExceeded:
    case Status::FileSizeLimitExceeded:
    case Status::MemoryLimitExceeded:
    case Status::Signaled: break;
    }
    auto text = report.output;
    if (not text.empty() and text.back() != '\n') {
        text += '\n';
    }
    text += concat_tostr('[', report.comment, "]\n");
    return text;
}

} // namespace gradebox::grading
