#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <sys/types.h>

// Writes the whole buffer unless an error occurs; returns the number of bytes written.
// On error errno is set.
size_t write_all(int fd, const void* buf, size_t len) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Reads @p len bytes starting at @p pos unless an error or EOF occurs; returns the number of
// bytes read. errno is set to 0 on EOF.
size_t pread_all(int fd, off_t pos, void* buf, size_t len) noexcept;

// Reads until EOF, throws on error
std::string read_all(int fd);

// Reads at most @p max_len bytes starting at offset @p beg, throws on error
std::string get_file_contents(int fd, off_t beg, off_t max_len);

std::string get_file_contents(const std::string& path);

// Creates or truncates the file, throws on error
void put_file_contents(const std::string& path, std::string_view data);
