#include "gradebox/grading/commands.hh"
#include "gradebox/macros/throw.hh"
#include "gradebox/string_traits.hh"

#include <filesystem>
#include <glob.h>
#include <optional>
#include <utility>

namespace {

// Returns the only match of @p pattern relative to @p run_dir or std::nullopt if there are
// zero or several matches
std::optional<std::string> glob_single(const std::string& pattern, const std::string& run_dir) {
    bool relative = not has_prefix(pattern, "/");
    auto prefix = relative ? run_dir + '/' : std::string{};
    auto full_pattern = prefix + pattern;

    glob_t gl{};
    int rc = glob(full_pattern.c_str(), 0, nullptr, &gl);
    if (rc == GLOB_NOMATCH) {
        globfree(&gl);
        return std::nullopt;
    }
    if (rc != 0) {
        globfree(&gl);
        THROW("glob(\"", full_pattern, "\") failed with code ", rc);
    }
    std::optional<std::string> res;
    if (gl.gl_pathc == 1) {
        std::string_view match = gl.gl_pathv[0];
        if (relative and has_prefix(match, prefix)) {
            match.remove_prefix(prefix.size());
        }
        res = std::string{match};
    }
    globfree(&gl);
    return res;
}

} // namespace

namespace gradebox::grading {

std::vector<Command> parse_commands(std::string_view text) {
    std::vector<Command> commands;
    while (not text.empty()) {
        auto eol = text.find('\n');
        auto line = text.substr(0, eol);
        text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);

        Command command;
        size_t pos = 0;
        for (;;) {
            while (pos < line.size() and is_space(line[pos])) {
                ++pos;
            }
            if (pos == line.size()) {
                break;
            }
            auto beg = pos;
            while (pos < line.size() and not is_space(line[pos])) {
                ++pos;
            }
            command.emplace_back(line.substr(beg, pos - beg));
        }
        if (not command.empty()) {
            commands.emplace_back(std::move(command));
        }
    }
    return commands;
}

Command expand_command(const Command& command, const std::string& run_dir) {
    Command expanded;
    expanded.reserve(command.size());
    for (const auto& arg : command) {
        if (arg.find('*') != std::string::npos) {
            auto match = glob_single(arg, run_dir);
            expanded.emplace_back(match ? std::move(*match) : arg);
        } else if (arg.find("./") != std::string::npos and not has_prefix(arg, "./")) {
            expanded.emplace_back(
                (std::filesystem::path{run_dir} / arg).lexically_normal().native());
        } else {
            expanded.emplace_back(arg);
        }
    }
    return expanded;
}

std::string to_string(const Command& command) {
    std::string res;
    for (const auto& arg : command) {
        if (not res.empty()) {
            res += ' ';
        }
        res += arg;
    }
    return res;
}

} // namespace gradebox::grading
