#pragma once

#include <string>

// Creates a directory using mkdtemp(3) and removes it recursively on destruction
class TemporaryDirectory {
    std::string path_;

public:
    TemporaryDirectory() = default;

    // @p templ has to end with "XXXXXX", throws on error
    explicit TemporaryDirectory(std::string templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&& other) noexcept;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(TemporaryDirectory&& other) noexcept;

    ~TemporaryDirectory();

    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    // Path without trailing '/'
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
};
