#include "gradebox/errmsg.hh"
#include "gradebox/file_manip.hh"
#include "gradebox/macros/throw.hh"
#include "gradebox/temporary_directory.hh"

#include <cstdlib>
#include <utility>

TemporaryDirectory::TemporaryDirectory(std::string templ) : path_{std::move(templ)} {
    if (mkdtemp(path_.data()) == nullptr) {
        auto err = errno;
        auto templ_copy = std::move(path_);
        path_.clear();
        THROW("mkdtemp(\"", templ_copy, "\")", errmsg(err));
    }
}

TemporaryDirectory::TemporaryDirectory(TemporaryDirectory&& other) noexcept
: path_{std::exchange(other.path_, {})} {}

TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& other) noexcept {
    if (exists()) {
        (void)remove_r(path_);
    }
    path_ = std::exchange(other.path_, {});
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists()) {
        (void)remove_r(path_); // nothing sensible to do on error
    }
}
