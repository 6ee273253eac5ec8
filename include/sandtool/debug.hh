#pragma once

#include "sandtool/logger.hh"

// Compile-time switchable logger for tracing; disabled instances compile to nothing
template <bool enabled, bool verbose_enabled = false>
struct DebugLogger {
    template <class... Args>
    void operator()(const Args&... args) const noexcept {
        if constexpr (enabled) {
            errlog("debug: ", args...);
        }
    }

    template <class... Args>
    void verbose(const Args&... args) const noexcept {
        if constexpr (enabled and verbose_enabled) {
            errlog("debug: ", args...);
        }
    }
};

#ifdef SANDTOOL_DEBUG
constexpr bool debug_logging_enabled = true;
#else
constexpr bool debug_logging_enabled = false;
#endif
