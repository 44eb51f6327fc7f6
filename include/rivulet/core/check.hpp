// ============================================================================
// rivulet/core/check.hpp - Always-On Runtime Assertions
// ============================================================================
//
// RIVULET_CHECK(cond, msg) guards preconditions whose violation is a bug in
// the calling code: completing a Promise twice, awaiting a Task twice,
// building an execution model from nonsense. It stays active in Release
// builds.
//
// On failure it writes the condition, the message and the call site to
// stderr and aborts. Recoverable conditions never go through here; they
// travel as rivulet::Error inside Result or Deferred.
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace rivulet::detail {

// Writes the decimal digits of `value` ending at `buf_end`, returns the first
// digit. The caller provides at least 10 bytes.
inline char* FormatLine(unsigned int value, char* buf_end) {
    char* p = buf_end;
    do {
        *--p = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value != 0);
    return p;
}

[[noreturn]] inline void CheckFailed(const char* cond_str, const char* msg, const std::source_location& loc) {
    char line_buf[12];
    char* line_end = line_buf + sizeof(line_buf);
    char* line_str = FormatLine(loc.line(), line_end);

    std::fputs("rivulet: RIVULET_CHECK(", stderr);
    std::fputs(cond_str, stderr);
    std::fputs(") failed: ", stderr);
    std::fputs(msg, stderr);
    std::fputs("\n  at ", stderr);
    std::fputs(loc.file_name(), stderr);
    std::fputs(":", stderr);
    std::fwrite(line_str, 1, static_cast<size_t>(line_end - line_str), stderr);
    std::fputs(" in ", stderr);
    std::fputs(loc.function_name(), stderr);
    std::fputs("\n", stderr);
    std::abort();
}

}  // namespace rivulet::detail

#define RIVULET_CHECK(cond, msg)                                                         \
    do {                                                                                 \
        if (!(cond)) [[unlikely]] {                                                      \
            ::rivulet::detail::CheckFailed(#cond, msg, std::source_location::current()); \
        }                                                                                \
    } while (0)
