#pragma once

#include "gradebox/file_descriptor.hh"
#include "gradebox/sandbox.hh"

#include <sys/types.h>

namespace sandbox::tracee {

// Exit code of the tracee if it failed to set up or to execute options.executable; the error
// description is written to error_fd
constexpr int SETUP_ERROR_EXIT_CODE = 42;
// Same as above, but when options.executable does not exist
constexpr int EXECUTABLE_NOT_FOUND_EXIT_CODE = 127;

[[noreturn]] void
execute(const Options& options, FileDescriptor error_fd, pid_t parent_pid) noexcept;

} // namespace sandbox::tracee
