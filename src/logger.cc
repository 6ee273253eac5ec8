#include "sandtool/logger.hh"

#include <ctime>

Logger errlog{stderr};

void Logger::write_line(std::string_view line) noexcept {
    std::lock_guard lock{mutex_};
    flockfile(f_);
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char date[32];
    auto len = std::strftime(date, sizeof(date), "[ %Y-%m-%d %H:%M:%S ] ", &tm);
    (void)fwrite_unlocked(date, 1, len, f_);
    (void)fwrite_unlocked(line.data(), 1, line.size(), f_);
    (void)fputc_unlocked('\n', f_);
    (void)fflush_unlocked(f_);
    funlockfile(f_);
}
