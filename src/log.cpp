#include "layerpush/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace layerpush {

namespace {

std::atomic<bool> g_verbose{false};

// Keeps lines from concurrent request handlers from interleaving
std::mutex g_log_mutex;

}  // namespace

void set_verbose_logging(bool enabled) {
    g_verbose.store(enabled, std::memory_order_relaxed);
}

bool verbose_logging() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_info(const char* fmt, ...) {
    std::lock_guard lock(g_log_mutex);
    va_list args;
    va_start(args, fmt);
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void log_debug(const char* fmt, ...) {
    if (!verbose_logging()) return;
    std::lock_guard lock(g_log_mutex);
    va_list args;
    va_start(args, fmt);
    fprintf(stdout, "[debug] ");
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void log_error(const char* fmt, ...) {
    std::lock_guard lock(g_log_mutex);
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "ERROR: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

} // namespace layerpush
