#include "chatvault/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace chatvault {

namespace {

std::atomic<bool> g_verbose{false};

// Keeps lines from concurrent workers from interleaving
std::mutex g_log_mutex;

void vlog(FILE* stream, const char* prefix, const char* fmt, va_list args) {
    std::lock_guard lock(g_log_mutex);
    if (prefix) fputs(prefix, stream);
    vfprintf(stream, fmt, args);
    fputc('\n', stream);
    fflush(stream);
}

}  // namespace

void set_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool is_verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stdout, nullptr, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "WARN: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!is_verbose()) return;
    va_list args;
    va_start(args, fmt);
    vlog(stdout, nullptr, fmt, args);
    va_end(args);
}

}  // namespace chatvault
