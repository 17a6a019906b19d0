#include "wsbridge/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace wsbridge {

namespace {

std::atomic<bool> g_verbose{false};

// Workers log concurrently; keep each line intact
std::mutex g_log_mutex;

}  // namespace

void set_log_verbose(bool verbose) {
    g_verbose = verbose;
}

bool log_verbose() {
    return g_verbose.load();
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

void log_error(const char* fmt, ...) {
    std::lock_guard lock(g_log_mutex);
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "ERROR: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

void log_debug(const char* fmt, ...) {
    if (!g_verbose.load()) return;
    std::lock_guard lock(g_log_mutex);
    va_list args;
    va_start(args, fmt);
    fprintf(stdout, "DEBUG: ");
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

}  // namespace wsbridge
