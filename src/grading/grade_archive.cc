#include "gradebox/concat_tostr.hh"
#include "gradebox/errmsg.hh"
#include "gradebox/file_contents.hh"
#include "gradebox/file_descriptor.hh"
#include "gradebox/file_manip.hh"
#include "gradebox/grading/blackboard_info.hh"
#include "gradebox/grading/commands.hh"
#include "gradebox/grading/grade_archive.hh"
#include "gradebox/grading/run_command.hh"
#include "gradebox/logger.hh"
#include "gradebox/macros/throw.hh"
#include "gradebox/string_traits.hh"

#include <cerrno>
#include <exception>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace {

using namespace gradebox::grading;

bool path_exists(const std::string& path) noexcept {
    struct stat st {};
    return lstat(path.c_str(), &st) == 0;
}

// Removes the directory when leaving the scope
class DirectoryRemover {
    std::string path_;

public:
    explicit DirectoryRemover(std::string path) noexcept : path_{std::move(path)} {}

    DirectoryRemover(const DirectoryRemover&) = delete;
    DirectoryRemover(DirectoryRemover&&) = delete;
    DirectoryRemover& operator=(const DirectoryRemover&) = delete;
    DirectoryRemover& operator=(DirectoryRemover&&) = delete;

    ~DirectoryRemover() {
        if (remove_r(path_)) {
            errlog("warning: failed to remove \"", path_, '"', errmsg());
        }
    }
};

struct Grading {
    const GradingOptions& options;
    std::string work_dir;
    std::string resources_dir;
    std::string commands_file;
    std::string temp_dir;
    std::string submissions_dir;

    explicit Grading(const GradingOptions& options)
    : options{options}
    , work_dir{path_absolute(options.work_dir)}
    , resources_dir{path_absolute(options.resources_dir)}
    , commands_file{path_absolute(options.commands_file)}
    , temp_dir{concat_tostr(work_dir, '/', TEMP_DIR)}
    , submissions_dir{concat_tostr(work_dir, '/', SUBMISSIONS_DIR)} {}

    void check_paths() const {
        if (not is_directory(work_dir)) {
            THROW(work_dir, " is not a valid path");
        }
        if (not is_directory(resources_dir)) {
            THROW(resources_dir, " is not a valid path");
        }
        if (access(resources_dir.c_str(), R_OK | X_OK)) {
            THROW(resources_dir, " is not a readable dir");
        }
        if (not is_regular_file(options.archive)) {
            THROW(options.archive, " is not a file");
        }
        (void)parse_commands(get_file_contents(commands_file)); // fail early if unreadable
    }

    void make_top_level_dirs() const {
        for (const auto& dir : {temp_dir, submissions_dir}) {
            if (path_exists(dir)) {
                THROW(dir, " directory already exists");
            }
        }
        for (const auto& dir : {temp_dir, submissions_dir}) {
            if (mkdir(dir)) {
                THROW("mkdir(", dir, ")", errmsg());
            }
        }
        if (options.identity) {
            chown_r(temp_dir, options.identity->uid, options.identity->gid);
        }
    }

    RunContext run_context(const std::string& run_dir) const {
        return {
            .working_dir = run_dir,
            .stdin_fd = -1,
            .identity = options.identity,
            .limits = options.limits,
        };
    }

    void copy_resources(const std::string& run_dir) const {
        for (const auto& name : list_directory(resources_dir)) {
            auto src = concat_tostr(resources_dir, '/', name);
            if (not is_regular_file(src)) {
                continue;
            }
            if (copy(src, concat_tostr(run_dir, '/', name))) {
                THROW("copying resource ", src, errmsg());
            }
        }
    }

    StudentSummary grade_student(const std::string& info_name) const {
        auto info_path = concat_tostr(temp_dir, '/', info_name);
        auto info = parse_info_file(get_file_contents(info_path), info_name);
        const auto& id = info.student_id;
        StudentSummary summary{
            .student_id = id,
            .statuses = {},
            .error = std::nullopt,
        };

        auto student_dir = concat_tostr(submissions_dir, '/', id);
        if (mkdir(student_dir)) {
            THROW("mkdir(", student_dir, ")", errmsg());
        }
        auto info_dest = concat_tostr(student_dir, '/', info_file_name(id));
        if (rename_path(info_path, info_dest)) {
            THROW("rename(", info_path, ", ", info_dest, ")", errmsg());
        }

        auto run_dir = concat_tostr(temp_dir, '/', RUN_DIR);
        if (mkdir(run_dir)) {
            THROW("mkdir(", run_dir, ")", errmsg());
        }
        DirectoryRemover run_dir_remover{run_dir};

        for (const auto& file : info.files) {
            auto src = concat_tostr(temp_dir, '/', file.archived_name);
            auto dest = concat_tostr(student_dir, '/', file.original_name);
            if (rename_path(src, dest)) {
                errlog("warning: ", id, ": cannot move ", file.archived_name, " to ",
                       file.original_name, errmsg());
                continue;
            }
            if (is_runnable_file(file.original_name) and
                copy(dest, concat_tostr(run_dir, '/', file.original_name)))
            {
                THROW("copying ", dest, errmsg());
            }
        }

        put_file_contents(
            concat_tostr(student_dir, '/', grading_file_name(id)),
            grading_template(options.assignment, id, options.grader)
        );

        copy_resources(run_dir);
        if (options.identity) {
            chown_r(run_dir, options.identity->uid, options.identity->gid);
        }

        // Re-read for every student, the file may be edited while grading is in progress
        auto commands = parse_commands(get_file_contents(commands_file));
        auto ctx = run_context(run_dir);
        std::string output;
        for (const auto& command : commands) {
            auto report = run_command(expand_command(command, run_dir), ctx);
            output += report_text(report);
            summary.statuses.emplace_back(report.status);
        }
        put_file_contents(concat_tostr(student_dir, '/', output_file_name(id)), output);
        return summary;
    }
};

} // namespace

namespace gradebox::grading {

std::string info_file_name(std::string_view student_id) {
    return concat_tostr(student_id, ".info.txt");
}

std::string output_file_name(std::string_view student_id) {
    return concat_tostr(student_id, ".out.txt");
}

std::string grading_file_name(std::string_view student_id) {
    return concat_tostr(student_id, ".grading.txt");
}

std::string grading_template(
    std::string_view assignment, std::string_view student_id, std::string_view grader
) {
    return concat_tostr(
        "Grading for ", assignment, " (", student_id, ").\n",
        "\n",
        "*\n",
        "\n",
        "Score: \n",
        "Grader: ", grader, '\n');
}

bool is_runnable_file(std::string_view file_name) noexcept {
    return has_suffix(file_name, ".c") or has_suffix(file_name, ".h") or file_name == "Makefile";
}

size_t GradingSummary::failed() const noexcept {
    size_t res = 0;
    for (const auto& student : students) {
        res += student.error.has_value();
    }
    return res;
}

std::string summary_text(const GradingSummary& summary) {
    std::string res;
    for (const auto& student : summary.students) {
        res += student.student_id;
        res += ':';
        if (student.error) {
            res += concat_tostr(" error: ", *student.error);
        }
        for (auto status : student.statuses) {
            res += concat_tostr(' ', to_string(status));
        }
        res += '\n';
    }
    return res;
}

void extract_archive(
    const std::string& archive,
    const std::string& dest_dir,
    const std::optional<Identity>& identity,
    const RunLimits& limits
) {
    FileDescriptor archive_fd{archive, O_RDONLY | O_CLOEXEC};
    if (not archive_fd.is_open()) {
        THROW("open(", archive, ")", errmsg());
    }
    // unzip needs a seekable file; /dev/stdin reopens the archive through the descriptor, so
    // the run identity needs no access to the directory of the archive
    auto report = run_command(
        {"unzip", "-q", "-o", "/dev/stdin"},
        {
            .working_dir = dest_dir,
            .stdin_fd = archive_fd,
            .identity = identity,
            .limits = limits,
        }
    );
    using Status = CommandReport::Status;
    // unzip exits with 1 on warnings
    if (report.status == Status::OK or
        (report.status == Status::NonZeroExit and report.result->si.status == 1))
    {
        return;
    }
    THROW("extracting ", archive, " failed: ", report.comment, '\n', report.output);
}

GradingSummary grade_archive(const GradingOptions& options) {
    Grading grading{options};
    grading.check_paths();
    grading.make_top_level_dirs();

    stdlog("Extracting ", options.archive);
    extract_archive(
        path_absolute(options.archive), grading.temp_dir, options.identity,
        options.extraction_limits
    );

    GradingSummary summary;
    for (const auto& name : list_directory(grading.temp_dir)) {
        if (not is_info_file_name(name)) {
            continue;
        }
        try {
            auto student = grading.grade_student(name);
            std::string statuses;
            for (auto status : student.statuses) {
                statuses += concat_tostr(' ', to_string(status));
            }
            stdlog("Graded ", student.student_id, ':', statuses);
            summary.students.emplace_back(std::move(student));
        } catch (const std::exception& e) {
            errlog("error: ", name, ": ", e.what());
            summary.students.push_back({
                .student_id = name,
                .statuses = {},
                .error = e.what(),
            });
        }
    }

    if (not options.keep_temp and remove_r(grading.temp_dir)) {
        THROW("removing ", grading.temp_dir, errmsg());
    }

    summary.summary_file = concat_tostr(grading.submissions_dir, '/', SUMMARY_FILE);
    put_file_contents(summary.summary_file, summary_text(summary));
    stdlog("Graded ", summary.students.size(), " submission(s), ", summary.failed(),
           " failed; summary saved to ", summary.summary_file);
    return summary;
}

} // namespace gradebox::grading
