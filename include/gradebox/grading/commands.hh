#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gradebox::grading {

using Command = std::vector<std::string>; // argv

// One command per line, arguments separated by whitespace; no quoting. Blank lines are
// skipped.
std::vector<Command> parse_commands(std::string_view text);

// Expands the arguments of @p command without using a shell, as if the command was run in
// directory @p run_dir:
// - an argument containing '*' is globbed; it is replaced with the match if there is exactly
//   one, otherwise it is left as is,
// - an argument starting with "./" is left as is,
// - other arguments containing "./" are made absolute (against @p run_dir) and normalized.
// Throws on error.
Command expand_command(const Command& command, const std::string& run_dir);

// Joins the arguments with spaces
std::string to_string(const Command& command);

} // namespace gradebox::grading
