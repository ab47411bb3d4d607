/**
 * @file log.cpp
 * @brief Process-wide log handler
 */

#include "log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

namespace saio {

namespace {

std::mutex log_mutex;
LogHandler log_handler_fn;
std::atomic<bool> log_installed{false};

void dispatch(LogLevel level, std::string_view msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_handler_fn) {
        log_handler_fn(level, msg);
    }
}

} // namespace

void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_handler_fn = std::move(handler);
    log_installed.store(static_cast<bool>(log_handler_fn), std::memory_order_release);
}

void clear_log_handler() noexcept {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_installed.store(false, std::memory_order_release);
    log_handler_fn = nullptr;
}

void log_emit(LogLevel level, std::string_view msg) {
    if (!log_installed.load(std::memory_order_acquire)) {
        return;
    }
    dispatch(level, msg);
}

namespace detail {

void log(LogLevel level, const char *fmt, ...) noexcept {
    // Fast path: skip formatting when nobody is listening
    if (!log_installed.load(std::memory_order_acquire)) {
        return;
    }

    char small[256];
    va_list ap;
    va_start(ap, fmt);
    int n = std::vsnprintf(small, sizeof(small), fmt, ap);
    va_end(ap);
    if (n < 0) {
        return;
    }

    try {
        if (static_cast<size_t>(n) < sizeof(small)) {
            dispatch(level, std::string_view(small, static_cast<size_t>(n)));
            return;
        }
        std::vector<char> big(static_cast<size_t>(n) + 1);
        va_start(ap, fmt);
        std::vsnprintf(big.data(), big.size(), fmt, ap);
        va_end(ap);
        dispatch(level, std::string_view(big.data(), static_cast<size_t>(n)));
    } catch (...) {
        // Handlers run on paths that must not unwind (destructors, fatal checks)
        std::terminate();
    }
}

} // namespace detail

} // namespace saio
