#include "gradebox/concat_tostr.hh"
#include "gradebox/environment.hh"
#include "gradebox/grading/grade_archive.hh"
#include "gradebox/logger.hh"
#include "gradebox/privilege.hh"
#include "gradebox/string_traits.hh"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

using gradebox::grading::GradingOptions;

namespace {

constexpr int EXIT_FATAL_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;

constexpr std::string_view USAGE = "Usage: grade [options] <zipfile> <assignment> <grader>";

constexpr std::string_view HELP = R"(
Grades Blackboard submissions: extracts <zipfile>, creates submissions/<student id>/ for
every student and runs there the commands from the commands file on the student's code.

Options:
  -d, --directory DIR       grading directory (default: .)
  -r, --resources DIR       files copied next to every submission (default: resources)
  -c, --commands FILE       commands to run, one per line (default: commands.txt)
  -u, --user NAME           run submissions as NAME (default: grader if run as root)
  -t, --time-limit SECONDS  wall time limit of each command (default: 10)
  -m, --memory-limit MIB    memory limit of each command (default: 1024)
      --output-limit KIB    captured output limit of each command (default: 1024)
      --file-size-limit MIB limit of the size of created files (default: 64)
      --processes N         limit of the number of processes of the run user
      --keep-temp           do not remove the temp/ directory
      --log-file PATH       append log to PATH instead of stdout
  -q, --quiet               log only errors
      --check-env           check the grading environment and exit
  -h, --help                display this help and exit
)";

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CmdOptions {
    GradingOptions grading;
    std::optional<std::string> user;
    std::optional<std::string> log_file;
    bool quiet = false;
    bool check_env = false;
    bool help = false;
};

template <class T>
T parse_number(std::string_view flag, std::string_view value) {
    auto num = str2num<T>(value);
    if (not num) {
        throw UsageError{concat_tostr("invalid value of ", flag, ": ", value)};
    }
    return *num;
}

CmdOptions parse_args(int argc, char** argv) {
    CmdOptions opts;
    std::vector<std::string_view> positional;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw UsageError{concat_tostr("option ", arg, " requires an argument")};
            }
            return argv[++i];
        };

        if (arg == "-h" or arg == "--help") {
            opts.help = true;
        } else if (arg == "-d" or arg == "--directory") {
            opts.grading.work_dir = value();
        } else if (arg == "-r" or arg == "--resources") {
            opts.grading.resources_dir = value();
        } else if (arg == "-c" or arg == "--commands") {
            opts.grading.commands_file = value();
        } else if (arg == "-u" or arg == "--user") {
            opts.user = value();
        } else if (arg == "-t" or arg == "--time-limit") {
            auto secs = parse_number<uint32_t>(arg, value());
            if (secs == 0) {
                throw UsageError{"time limit has to be positive"};
            }
            opts.grading.limits.time_limit = std::chrono::seconds{secs};
        } else if (arg == "-m" or arg == "--memory-limit") {
            opts.grading.limits.memory_limit_in_bytes = parse_number<uint64_t>(arg, value())
                << 20;
        } else if (arg == "--output-limit") {
            opts.grading.limits.output_limit_in_bytes = parse_number<uint64_t>(arg, value())
                << 10;
        } else if (arg == "--file-size-limit") {
            opts.grading.limits.file_size_limit_in_bytes = parse_number<uint64_t>(arg, value())
                << 20;
        } else if (arg == "--processes") {
            opts.grading.limits.max_processes = parse_number<unsigned>(arg, value());
        } else if (arg == "--keep-temp") {
            opts.grading.keep_temp = true;
        } else if (arg == "--log-file") {
            opts.log_file = value();
        } else if (arg == "-q" or arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--check-env") {
            opts.check_env = true;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                positional.emplace_back(argv[i]);
            }
        } else if (has_prefix(arg, "-") and arg.size() > 1) {
            throw UsageError{concat_tostr("unknown option: ", arg)};
        } else {
            positional.emplace_back(arg);
        }
    }

    if (opts.help or opts.check_env) {
        return opts;
    }
    if (positional.size() != 3) {
        throw UsageError{"expected exactly 3 arguments: <zipfile> <assignment> <grader>"};
    }
    opts.grading.archive = positional[0];
    opts.grading.assignment = positional[1];
    opts.grading.grader = positional[2];
    return opts;
}

int check_env(const CmdOptions& opts) {
    gradebox::EnvironmentCheckOptions check_opts;
    check_opts.run_user = opts.user;
    char exe[4096];
    auto len = readlink("/proc/self/exe", exe, sizeof(exe) - 1);
    if (len > 0) {
        check_opts.grade_executable.assign(exe, static_cast<size_t>(len));
    }
    auto report = gradebox::check_environment(check_opts);
    (void)fputs(report.to_string().c_str(), stdout);
    return report.ok() ? 0 : EXIT_FATAL_ERROR;
}

} // namespace

int main(int argc, char** argv) {
    CmdOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const UsageError& e) {
        (void)fprintf(
            stderr, "%s\n%.*s\n", e.what(), static_cast<int>(USAGE.size()), USAGE.data()
        );
        return EXIT_USAGE_ERROR;
    }
    if (opts.help) {
        (void)printf("%.*s\n%.*s", static_cast<int>(USAGE.size()), USAGE.data(),
                     static_cast<int>(HELP.size()), HELP.data());
        return 0;
    }

    try {
        if (opts.check_env) {
            return check_env(opts);
        }
        if (opts.log_file) {
            stdlog.open(*opts.log_file);
            errlog.open(*opts.log_file);
        }
        stdlog.set_enabled(not opts.quiet);

        opts.grading.identity = gradebox::resolve_run_identity(geteuid(), opts.user);
        if (opts.grading.identity) {
            stdlog("Running submissions as ", opts.grading.identity->name, " (uid ",
                   opts.grading.identity->uid, ')');
        }
        auto summary = gradebox::grading::grade_archive(opts.grading);
        (void)printf("Summary saved to %s\n", summary.summary_file.c_str());
        return 0;
    } catch (const std::exception& e) {
        if (opts.log_file) {
            errlog("error: ", e.what());
        }
        (void)fprintf(stderr, "error: %s\n", e.what());
        return EXIT_FATAL_ERROR;
    }
}
