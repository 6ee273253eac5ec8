#pragma once

#include "sandtool/concat_tostr.hh"

#include <cstdio>
#include <exception>
#include <mutex>
#include <string_view>

// Thread-safe line logger; every call produces exactly one "[ date ] message" line
class Logger {
    FILE* f_;
    std::mutex mutex_;

    void write_line(std::string_view line) noexcept;

public:
    explicit Logger(FILE* f) noexcept
    : f_{f} {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;
    ~Logger() = default;

    template <class... Args>
    void operator()(const Args&... args) noexcept {
        try {
            write_line(concat_tostr(args...));
        } catch (const std::exception&) {
            write_line("Logger: failed to format the message");
        }
    }
};

extern Logger errlog; // writes to stderr
