#include "gradebox/errmsg.hh"
#include "gradebox/file_manip.hh"
#include "gradebox/macros/throw.hh"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

int set_errno_from(const std::error_code& ec) noexcept {
    errno = ec.value();
    return -1;
}

} // namespace

int remove_r(const std::string& path) noexcept {
    std::error_code ec;
    fs::remove_all(path, ec);
    return ec ? set_errno_from(ec) : 0;
}

int copy(const std::string& src, const std::string& dest) noexcept {
    std::error_code ec;
    fs::copy_file(src, dest, fs::copy_options::overwrite_existing, ec);
    return ec ? set_errno_from(ec) : 0;
}

void chown_r(const std::string& path, uid_t uid, gid_t gid) {
    if (lchown(path.c_str(), uid, gid)) {
        THROW("lchown(\"", path, "\")", errmsg());
    }
    if (not is_directory(path)) {
        return;
    }
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator{path, ec};
         not ec and it != fs::recursive_directory_iterator{};
         it.increment(ec))
    {
        if (lchown(it->path().c_str(), uid, gid)) {
            THROW("lchown(", it->path(), ")", errmsg());
        }
    }
    if (ec) {
        THROW("iterating over \"", path, "\"", errmsg(ec.value()));
    }
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> names;
    std::error_code ec;
    for (auto it = fs::directory_iterator{path, ec}; not ec and it != fs::directory_iterator{};
         it.increment(ec))
    {
        names.emplace_back(it->path().filename().native());
    }
    if (ec) {
        THROW("listing \"", path, "\"", errmsg(ec.value()));
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool is_directory(const std::string& path) noexcept {
    struct stat st {};
    return stat(path.c_str(), &st) == 0 and S_ISDIR(st.st_mode);
}

bool is_regular_file(const std::string& path) noexcept {
    struct stat st {};
    return stat(path.c_str(), &st) == 0 and S_ISREG(st.st_mode);
}

std::string path_absolute(const std::string& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    if (ec) {
        THROW("making \"", path, "\" absolute", errmsg(ec.value()));
    }
    auto res = abs.lexically_normal().native();
    if (res.size() > 1 and res.back() == '/') {
        res.pop_back();
    }
    return res;
}
