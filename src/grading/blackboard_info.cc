#include "gradebox/grading/blackboard_info.hh"
#include "gradebox/macros/throw.hh"
#include "gradebox/string_traits.hh"

#include <cstddef>
#include <optional>

namespace {

constexpr std::string_view ATTEMPT_MARKER = "_attempt_";
constexpr size_t ATTEMPT_DATE_LEN = 19; // e.g. 2016-02-03-12-41-18

constexpr std::string_view NAME_PREFIX = "Name:";
constexpr std::string_view ORIGINAL_FILENAME_PREFIX = "\tOriginal filename: ";
constexpr std::string_view FILENAME_PREFIX = "\tFilename: ";

// "Name: John Smith (abc123)" -> "abc123"; the id is enclosed in the last parentheses that
// end the line
std::optional<std::string_view> extract_student_id(std::string_view line) noexcept {
    if (not has_prefix(line, NAME_PREFIX) or not has_suffix(line, ")")) {
        return std::nullopt;
    }
    auto inner_end = line.size() - 1;
    auto pos = inner_end;
    while (pos > NAME_PREFIX.size()) {
        pos = line.rfind('(', pos - 1);
        if (pos == std::string_view::npos or pos <= NAME_PREFIX.size()) {
            // There has to be at least one character of the name before '('
            return std::nullopt;
        }
        if (pos + 1 < inner_end) {
            return line.substr(pos + 1, inner_end - pos - 1);
        }
    }
    return std::nullopt;
}

bool is_safe_file_name(std::string_view name) noexcept {
    return not name.empty() and name != "." and name != ".." and
        name.find('/') == std::string_view::npos and name.find('\0') == std::string_view::npos;
}

} // namespace

namespace gradebox::grading {

bool is_info_file_name(std::string_view file_name) noexcept {
    for (auto pos = file_name.find(ATTEMPT_MARKER, 1); pos != std::string_view::npos;
         pos = file_name.find(ATTEMPT_MARKER, pos + 1))
    {
        auto rest = file_name.substr(pos + ATTEMPT_MARKER.size());
        if (rest.size() < ATTEMPT_DATE_LEN + 4) {
            return false;
        }
        bool date_ok = true;
        for (size_t i = 0; i < ATTEMPT_DATE_LEN; ++i) {
            if (not is_digit(rest[i]) and rest[i] != '-') {
                date_ok = false;
                break;
            }
        }
        if (date_ok and rest.substr(ATTEMPT_DATE_LEN, 4) == ".txt") {
            return true;
        }
    }
    return false;
}

InfoFile parse_info_file(std::string_view contents, std::string_view file_name) {
    InfoFile info;
    std::optional<std::string_view> original_name;
    size_t line_no = 0;
    while (not contents.empty()) {
        auto eol = contents.find('\n');
        auto line = contents.substr(0, eol);
        contents.remove_prefix(eol == std::string_view::npos ? contents.size() : eol + 1);
        ++line_no;
        if (has_suffix(line, "\r")) {
            line.remove_suffix(1);
        }

        if (auto student_id = extract_student_id(line)) {
            if (not info.student_id.empty() and info.student_id != *student_id) {
                THROW(file_name, ':', line_no, ": second student in one info file: ",
                      *student_id);
            }
            if (not is_safe_file_name(*student_id)) {
                THROW(file_name, ':', line_no, ": invalid student id: ", *student_id);
            }
            info.student_id = *student_id;
            continue;
        }

        if (has_prefix(line, ORIGINAL_FILENAME_PREFIX) and
            line.size() > ORIGINAL_FILENAME_PREFIX.size())
        {
            original_name = line.substr(ORIGINAL_FILENAME_PREFIX.size());
            continue;
        }

        if (has_prefix(line, FILENAME_PREFIX) and line.size() > FILENAME_PREFIX.size()) {
            auto archived_name = line.substr(FILENAME_PREFIX.size());
            if (info.student_id.empty()) {
                THROW(file_name, ':', line_no, ": file listed before the student's name");
            }
            if (not original_name) {
                THROW(file_name, ':', line_no, ": file listed without its original filename");
            }
            if (not is_safe_file_name(*original_name)) {
                THROW(file_name, ':', line_no, ": unsafe original filename: ", *original_name);
            }
            if (not is_safe_file_name(archived_name)) {
                THROW(file_name, ':', line_no, ": unsafe filename: ", archived_name);
            }
            info.files.push_back({
                .original_name = std::string{*original_name},
                .archived_name = std::string{archived_name},
            });
            continue;
        }
    }
    if (info.student_id.empty()) {
        THROW(file_name, ": no line with the student's name");
    }
    return info;
}

} // namespace gradebox::grading
