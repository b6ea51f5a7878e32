#pragma once

namespace layerpush {

/// Enable or disable log_debug() output (off by default).
void set_verbose_logging(bool enabled);
bool verbose_logging();

/// printf-style logging. Info and debug go to stdout, errors to stderr with
/// an "ERROR: " prefix. Each call writes one line.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace layerpush
