// ============================================================================
// rivulet/core/cancelable.hpp - Idempotent Subscription Handle
// ============================================================================
//
// Every subscription returns a Cancelable. Calling Cancel() asks the
// producer behind it to stop emitting; it does not wait for in-flight
// acknowledgments and it never raises.
//
// DESIGN:
// -------
// 1. IDEMPOTENT: The attached action runs at most once no matter how many
//    times, or from how many threads, Cancel() is called.
// 2. SHARED: Copies refer to the same state, so an operator can hand the
//    upstream handle to its own Cancelable and both observe one flag.
// 3. POLLABLE: IsCancelled() doubles as the flag a producer loop checks
//    between steps.
//
// USAGE:
// ------
//   Cancelable upstream = source->UnsafeSubscribeFn(inner);
//   return Cancelable([upstream]() mutable { upstream.Cancel(); });
//
//   Cancelable flag;              // no action, just a flag
//   flag.Cancel();
//   assert(flag.IsCancelled());
//
// ============================================================================

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <utility>

namespace rivulet {

// ============================================================================
// CancelableState - Shared flag plus one-shot action
// ============================================================================
class CancelableState {
   public:
    CancelableState() = default;
    explicit CancelableState(std::function<void()> on_cancel) : on_cancel_(std::move(on_cancel)) {}

    CancelableState(const CancelableState&) = delete;
    CancelableState& operator=(const CancelableState&) = delete;

    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    void Cancel() {
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        // Only the winning caller gets here, so on_cancel_ is not raced.
        auto action = std::move(on_cancel_);
        on_cancel_ = nullptr;
        if (action) {
            action();
        }
    }

   private:
    std::atomic<bool> cancelled_{false};
    std::function<void()> on_cancel_;
};

// ============================================================================
// Cancelable
// ============================================================================
class Cancelable {
   public:
    // A handle with no action; Cancel() only raises the flag
    Cancelable() : state_(std::make_shared<CancelableState>()) {}

    explicit Cancelable(std::function<void()> on_cancel)
        : state_(std::make_shared<CancelableState>(std::move(on_cancel))) {}

    void Cancel() { state_->Cancel(); }

    [[nodiscard]] bool IsCancelled() const noexcept { return state_->IsCancelled(); }

    // Handle for subscriptions that are already finished when returned
    [[nodiscard]] static Cancelable Empty() { return Cancelable{}; }

   private:
    std::shared_ptr<CancelableState> state_;
};

}  // namespace rivulet
