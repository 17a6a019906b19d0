#pragma once

namespace wsbridge {

/// Enable or disable log_debug() output (--verbose).
void set_log_verbose(bool verbose);
bool log_verbose();

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace wsbridge
