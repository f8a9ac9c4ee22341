#pragma once

#include "gradebox/grading/run_command.hh"
#include "gradebox/privilege.hh"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox::grading {

// Layout of the grading directory
constexpr std::string_view TEMP_DIR = "temp";
constexpr std::string_view SUBMISSIONS_DIR = "submissions";
constexpr std::string_view RUN_DIR = "run"; // inside TEMP_DIR
constexpr std::string_view SUMMARY_FILE = "summary.txt"; // inside SUBMISSIONS_DIR

// Names of the files created in the directory of every student
std::string info_file_name(std::string_view student_id);
std::string output_file_name(std::string_view student_id);
std::string grading_file_name(std::string_view student_id);

// Template of the file the grader fills in
std::string
grading_template(std::string_view assignment, std::string_view student_id, std::string_view grader);

// Whether a submitted file is copied to the directory in which the commands are run
bool is_runnable_file(std::string_view file_name) noexcept;

struct GradingOptions {
    std::string archive; // zip file downloaded from Blackboard
    std::string assignment;
    std::string grader;
    std::string work_dir = ".";
    std::string resources_dir = "resources";
    std::string commands_file = "commands.txt";
    // Identity that extracts the archive and runs the commands (see resolve_run_identity())
    std::optional<Identity> identity;
    RunLimits limits;
    RunLimits extraction_limits = {
        .time_limit = std::chrono::seconds{60},
        .memory_limit_in_bytes = uint64_t{512} << 20,
        .output_limit_in_bytes = uint64_t{1} << 20,
        .file_size_limit_in_bytes = uint64_t{1} << 30,
        .max_processes = std::nullopt,
    };
    bool keep_temp = false;
};

struct StudentSummary {
    std::string student_id; // name of the info file if the student id is unknown
    std::vector<CommandReport::Status> statuses; // one per command
    std::optional<std::string> error; // set if grading of this student failed
};

struct GradingSummary {
    std::vector<StudentSummary> students;
    std::string summary_file;

    [[nodiscard]] size_t failed() const noexcept;
};

// One line per student
std::string summary_text(const GradingSummary& summary);

// Extracts zip @p archive into @p dest_dir by running unzip(1) in the sandbox. Throws on
// error.
void extract_archive(
    const std::string& archive,
    const std::string& dest_dir,
    const std::optional<Identity>& identity,
    const RunLimits& limits
);

// Extracts the archive into TEMP_DIR, creates a directory in SUBMISSIONS_DIR for every
// student, and runs there the commands from the commands file on the student's submission
// saving their output. Failure of grading a single student is logged and reported in the
// summary; other errors are thrown.
GradingSummary grade_archive(const GradingOptions& options);

} // namespace gradebox::grading
