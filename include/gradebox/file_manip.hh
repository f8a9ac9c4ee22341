#pragma once

#include <cstdio>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <vector>

constexpr mode_t S_0755 = S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH;

// Creates a directory; returns 0 on success, -1 on error (errno is set)
inline int mkdir(const std::string& path, mode_t mode = S_0755) noexcept {
    return ::mkdir(path.c_str(), mode);
}

// Removes @p path recursively; returns 0 on success, -1 on error (errno is set)
int remove_r(const std::string& path) noexcept;

// Copies a regular file preserving its permissions, overwrites @p dest if it exists.
// Returns 0 on success, -1 on error (errno is set).
int copy(const std::string& src, const std::string& dest) noexcept;

// Returns 0 on success, -1 on error (errno is set)
inline int rename_path(const std::string& src, const std::string& dest) noexcept {
    return ::rename(src.c_str(), dest.c_str());
}

// Changes the owner of @p path and everything beneath it (symlinks are not followed).
// Throws on error.
void chown_r(const std::string& path, uid_t uid, gid_t gid);

// Returns sorted names of the entries of directory @p path (without "." and ".."). Throws on
// error.
std::vector<std::string> list_directory(const std::string& path);

[[nodiscard]] bool is_directory(const std::string& path) noexcept;

[[nodiscard]] bool is_regular_file(const std::string& path) noexcept;

// Returns @p path made absolute against the current working directory and normalized
std::string path_absolute(const std::string& path);
