#pragma once

#include <string>
#include <string_view>

namespace tether::util {

// Environment lookup accepting both TETHER_X and tether_x spellings.
const char* getenv_compat(const char* name);

// Verbose tracing to stderr, off unless TETHER_VERBOSE is set or
// set_trace_enabled(true) was called.
[[nodiscard]] bool trace_enabled();
void set_trace_enabled(bool on);

// printf-style; prefixes every line with "tether: ".
void trace(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Escape control bytes for a single-line diagnostic (\n, \r, \t, \xNN).
[[nodiscard]] std::string escape_for_log(std::string_view s, size_t max_len = 120);

} // namespace tether::util
