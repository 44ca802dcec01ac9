#pragma once

namespace s3xfer {

/// Enable or disable debug output process-wide.
void set_verbose(bool verbose);
bool is_verbose();

// printf-style line loggers. Info goes to stdout; debug, warnings and
// errors go to stderr so they never mix with command output. Each call emits exactly one line.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace s3xfer
