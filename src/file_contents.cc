#include "gradebox/file_contents.hh"
#include "gradebox/errmsg.hh"
#include "gradebox/file_descriptor.hh"
#include "gradebox/macros/throw.hh"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

size_t write_all(int fd, const void* buf, size_t len) noexcept {
    const auto* data = static_cast<const char*>(buf);
    size_t pos = 0;
    while (pos < len) {
        auto rc = write(fd, data + pos, len - pos);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        pos += static_cast<size_t>(rc);
    }
    return pos;
}

size_t pread_all(int fd, off_t pos, void* buf, size_t len) noexcept {
    auto* data = static_cast<char*>(buf);
    size_t done = 0;
    while (done < len) {
        auto rc = pread(fd, data + done, len - done, pos + static_cast<off_t>(done));
        if (rc == 0) {
            errno = 0;
            break;
        }
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        done += static_cast<size_t>(rc);
    }
    return done;
}

std::string read_all(int fd) {
    std::string res;
    char buff[1 << 14];
    for (;;) {
        auto rc = read(fd, buff, sizeof(buff));
        if (rc == 0) {
            return res;
        }
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        res.append(buff, static_cast<size_t>(rc));
    }
}

std::string get_file_contents(int fd, off_t beg, off_t max_len) {
    std::string res(static_cast<size_t>(max_len), '\0');
    auto len = pread_all(fd, beg, res.data(), res.size());
    if (len != res.size() and errno != 0) {
        THROW("pread()", errmsg());
    }
    res.resize(len);
    return res;
}

std::string get_file_contents(const std::string& path) {
    FileDescriptor fd{path, O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("open(\"", path, "\")", errmsg());
    }
    return read_all(fd);
}

void put_file_contents(const std::string& path, std::string_view data) {
    FileDescriptor fd{path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("open(\"", path, "\")", errmsg());
    }
    if (write_all(fd, data) != data.size()) {
        THROW("write(\"", path, "\")", errmsg());
    }
    if (fd.close()) {
        THROW("close(\"", path, "\")", errmsg());
    }
}
