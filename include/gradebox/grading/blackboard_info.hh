#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gradebox::grading {

// Whether @p file_name is a name of the info file that Blackboard puts into a submissions
// archive for every attempt, e.g. "Assignment 1_abc123_attempt_2016-02-03-12-41-18.txt"
bool is_info_file_name(std::string_view file_name) noexcept;

struct SubmittedFile {
    std::string original_name; // name of the file as submitted by the student
    std::string archived_name; // name of the file inside the archive
};

struct InfoFile {
    std::string student_id;
    std::vector<SubmittedFile> files;
};

// Parses contents of an info file; @p file_name is used only in error messages.
// Throws if the contents are malformed or a submitted file name is unsafe to use as a path
// component.
InfoFile parse_info_file(std::string_view contents, std::string_view file_name);

} // namespace gradebox::grading
