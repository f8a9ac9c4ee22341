#include "gradebox/errmsg.hh"
#include "gradebox/logger.hh"
#include "gradebox/macros/throw.hh"

#include <ctime>

Logger stdlog{stdout}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
Logger errlog{stderr}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

Logger::~Logger() {
    if (owns_stream_) {
        (void)fclose(stream_);
    }
}

void Logger::open(const std::string& path) {
    FILE* f = fopen(path.c_str(), "ae"); // "e" == O_CLOEXEC
    if (f == nullptr) {
        THROW("fopen(\"", path, "\")", errmsg());
    }
    use(f);
    owns_stream_ = true;
}

void Logger::use(FILE* stream) noexcept {
    if (owns_stream_) {
        (void)fclose(stream_);
    }
    stream_ = stream;
    owns_stream_ = false;
}

void Logger::write_line(std::string_view msg) {
    char date[32];
    time_t now = time(nullptr);
    struct tm tm {};
    if (localtime_r(&now, &tm) == nullptr or
        strftime(date, sizeof(date), "[%Y-%m-%d %H:%M:%S] ", &tm) == 0)
    {
        date[0] = '\0';
    }
    // One fwrite() per line
    std::string line;
    line.reserve(sizeof(date) + msg.size() + 1);
    line += date;
    line += msg;
    line += '\n';
    (void)fwrite(line.data(), 1, line.size(), stream_);
    (void)fflush(stream_);
}
