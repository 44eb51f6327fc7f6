// ============================================================================
// rivulet/core/error.hpp - Error Codes for rivulet
// ============================================================================
//
// Every failure that crosses a stream boundary is a std::error_code. Codes
// raised by the library itself live in the rivulet category below; codes
// produced by user step functions (any category) are forwarded untouched.
//
// USAGE:
// ------
//   Error ec = make_error_code(Errc::StepFailed);
//   subscriber->OnError(ec);
//
// ============================================================================

#pragma once

#include <system_error>

namespace rivulet {

enum class Errc {
    StepFailed = 1,
    NoSuchElement,
    BrokenPromise,
};

const std::error_category& RivuletCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// The error type carried by OnError, Result and Deferred
using Error = std::error_code;

}  // namespace rivulet

namespace std {
template <>
struct is_error_code_enum<rivulet::Errc> : true_type {};
}  // namespace std
