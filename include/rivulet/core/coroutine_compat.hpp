// ============================================================================
// rivulet/core/coroutine_compat.hpp - Symmetric Transfer under GCC + ASan
// ============================================================================
//
// GCC cannot emit the tail call that symmetric transfer relies on when
// AddressSanitizer is enabled (https://gcc.gnu.org/bugzilla/show_bug.cgi?id=100897),
// so every transfer would add a stack frame. On that configuration
// await_suspend returns void and resumes the target directly; everywhere
// else it returns the handle and the compiler performs the tail call.
//
//   SymmetricTransferResult await_suspend(std::coroutine_handle<> h) noexcept {
//       return SymmetricTransfer(next);
//   }
//
// ============================================================================

#pragma once

#include <coroutine>

namespace rivulet {

#if defined(__GNUG__) && !defined(__clang__) && defined(__SANITIZE_ADDRESS__)
#define RIVULET_ASAN_SYMMETRIC_TRANSFER_BROKEN 1
#else
#define RIVULET_ASAN_SYMMETRIC_TRANSFER_BROKEN 0
#endif

#if RIVULET_ASAN_SYMMETRIC_TRANSFER_BROKEN

using SymmetricTransferResult = void;

inline void SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    target.resume();
}

#else

using SymmetricTransferResult = std::coroutine_handle<>;

inline std::coroutine_handle<> SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    return target;
}

#endif

}  // namespace rivulet
