#pragma once

#include "gradebox/concat_tostr.hh"

#include <cstdio>
#include <string>
#include <string_view>

// Writes whole lines, each prefixed with the local time, to a stream
class Logger {
    FILE* stream_;
    bool owns_stream_ = false;
    bool enabled_ = true;

    void write_line(std::string_view msg);

public:
    explicit Logger(FILE* stream) noexcept : stream_{stream} {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    ~Logger();

    // Appends to the file at @p path from now on, throws on error
    void open(const std::string& path);

    // Logger takes no ownership of @p stream
    void use(FILE* stream) noexcept;

    void set_enabled(bool enabled) noexcept { enabled_ = enabled; }

    [[nodiscard]] bool is_enabled() const noexcept { return enabled_ and stream_ != nullptr; }

    template <class... Args>
    void operator()(const Args&... args) {
        if (is_enabled()) {
            write_line(concat_tostr(args...));
        }
    }
};

// By default writes to stdout
extern Logger stdlog; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
// By default writes to stderr
extern Logger errlog; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
