#pragma once

#include "gradebox/grading/commands.hh"
#include "gradebox/privilege.hh"
#include "gradebox/sandbox.hh"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gradebox::grading {

struct RunLimits {
    std::chrono::nanoseconds time_limit = std::chrono::seconds{10};
    std::optional<uint64_t> memory_limit_in_bytes = uint64_t{1} << 30;
    // Combined size of stdout and stderr that is captured
    uint64_t output_limit_in_bytes = uint64_t{1} << 20;
    std::optional<uint64_t> file_size_limit_in_bytes = uint64_t{64} << 20;
    std::optional<unsigned> max_processes;
};

struct RunContext {
    std::string working_dir;
    int stdin_fd = -1; // if negative, use /dev/null
    // If set, the command runs as this user, otherwise as the caller
    std::optional<Identity> identity;
    RunLimits limits;
};

struct CommandReport {
    // Sorted by decreasing priority
    enum class Status : uint8_t {
        SetupError,
        NotFound,
        TimeLimitExceeded,
        OutputLimitExceeded,
        FileSizeLimitExceeded,
        MemoryLimitExceeded,
        Signaled,
        NonZeroExit,
        OK,
    } status;

    std::string output; // stdout and stderr of the command, interleaved
    std::optional<sandbox::Result> result; // not set if the command was not run
    std::string comment;
};

std::string_view to_string(CommandReport::Status status) noexcept;

// Runs @p command in the sandbox with stdout and stderr captured.
// Errors that prevent running the command are reported as the NotFound or SetupError status;
// other errors are thrown.
CommandReport run_command(const Command& command, const RunContext& ctx);

// Text saved for the command: its output followed by a note if the command did not exit
// normally, or "File not found: ..." if it could not be started
std::string report_text(const CommandReport& report);

} // namespace gradebox::grading
