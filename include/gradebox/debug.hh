#pragma once

#include "gradebox/logger.hh"

// Logger that compiles to nothing unless enabled; meant for following what the sandbox does
template <bool enabled, bool verbose_enabled = false>
struct DebugLogger {
    template <class... Args>
    void operator()(const Args&... args) const {
        if constexpr (enabled) {
            errlog("[debug] ", args...);
        }
    }

    template <class... Args>
    void verbose(const Args&... args) const {
        if constexpr (enabled and verbose_enabled) {
            errlog("[debug] ", args...);
        }
    }
};
