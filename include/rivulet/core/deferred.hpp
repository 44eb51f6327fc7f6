// ============================================================================
// rivulet/core/deferred.hpp - Deferred Value with a Synchronous Fast Path
// ============================================================================
//
// Deferred<T> is a value that may already be known or may arrive later,
// possibly from another thread, possibly as a failure. It is the currency of
// the stream protocol: every OnNext answers with a Deferred<Ack>, and every
// state-action step returns a Deferred<(A, S)>.
//
// KEY CONCEPTS:
// -------------
// 1. TWO STATES, ONE TYPE: A resolved Deferred holds its Result<T, Error>
//    inline and allocates nothing. A pending one points at a shared
//    DeferredState that a Promise completes later.
//
// 2. RUN NOW OR REGISTER: OnComplete(), Map() and FlatMap() run their
//    continuation immediately on the calling thread when the outcome is
//    already known, and register it otherwise. Callers test IsReady() or
//    Poll() to pick the synchronous path explicitly.
//
// 3. MANY LISTENERS: A pending state keeps a list of continuations; an
//    operator may hand its last acknowledgment upstream and also wait on it
//    itself before a terminal signal.
//
// 4. NO EXCEPTIONS: Failure is the Err side of Result<T, Error>. It skips
//    Map/FlatMap continuations and propagates to the produced Deferred.
//
// USAGE:
// ------
//   Promise<int> promise;
//   Deferred<int> d = promise.GetDeferred();
//   d.Map([](int x) { return x * 2; })
//    .OnComplete([](const Result<int, Error>& r) { ... });
//   promise.Succeed(21);  // continuation runs here, on this thread
//
//   Deferred<int> now = 42;  // already resolved
//   assert(now.IsReady());
//
// ============================================================================

#pragma once

#include "rivulet/core/check.hpp"
#include "rivulet/core/error.hpp"
#include "rivulet/core/result.hpp"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace rivulet {

template <typename T>
class Deferred;

template <typename T>
class Promise;

// ============================================================================
// DeferredState - Shared completion slot
// ============================================================================
//
// The outcome is written once under the mutex and never modified afterwards,
// so continuations read it without holding the lock.
//
template <typename T>
class DeferredState {
   public:
    using Outcome = Result<T, Error>;
    using Callback = std::function<void(const Outcome&)>;

    DeferredState() = default;

    DeferredState(const DeferredState&) = delete;
    DeferredState& operator=(const DeferredState&) = delete;

    // Returns false when an outcome was already stored
    bool Complete(Outcome outcome) {
        std::vector<Callback> to_run;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (outcome_.has_value()) {
                return false;
            }
            outcome_.emplace(std::move(outcome));
            to_run.swap(callbacks_);
        }
        completed_cv_.notify_all();

        for (auto& callback : to_run) {
            callback(*outcome_);
        }
        return true;
    }

    void OnComplete(Callback callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!outcome_.has_value()) {
                callbacks_.push_back(std::move(callback));
                return;
            }
        }
        callback(*outcome_);
    }

    [[nodiscard]] std::optional<Outcome> Poll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outcome_;
    }

    [[nodiscard]] bool IsCompleted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outcome_.has_value();
    }

    Outcome Wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        completed_cv_.wait(lock, [this] { return outcome_.has_value(); });
        return *outcome_;
    }

   private:
    mutable std::mutex mutex_;
    std::condition_variable completed_cv_;
    std::optional<Outcome> outcome_;
    std::vector<Callback> callbacks_;
};

// ============================================================================
// Deferred<T>
// ============================================================================
template <typename T>
class Deferred {
   public:
    using value_type = T;
    using Outcome = Result<T, Error>;
    using Callback = std::function<void(const Outcome&)>;

    // Already-resolved value. Implicit so that `return Ack::Continue;`
    // works from an OnNext implementation.
    Deferred(T value) : ready_(Ok(std::move(value))) {}

    explicit Deferred(std::shared_ptr<DeferredState<T>> state) : state_(std::move(state)) {
        RIVULET_CHECK(state_ != nullptr, "Deferred built from a null state");
    }

    [[nodiscard]] static Deferred Now(T value) { return Deferred(std::move(value)); }

    [[nodiscard]] static Deferred Failed(Error error) {
        Deferred d;
        d.ready_.emplace(Err(error));
        return d;
    }

    [[nodiscard]] static Deferred FromOutcome(Outcome outcome) {
        Deferred d;
        d.ready_.emplace(std::move(outcome));
        return d;
    }

    // ========================================================================
    // Observers
    // ========================================================================

    [[nodiscard]] bool IsReady() const { return ready_.has_value() || state_->IsCompleted(); }

    // The outcome if already known, std::nullopt while pending
    [[nodiscard]] std::optional<Outcome> Poll() const {
        if (ready_) {
            return ready_;
        }
        return state_->Poll();
    }

    // Block the calling thread until the outcome is known. Only for the
    // boundary between synchronous code and the stream; never call it from a
    // callback that the completing thread is itself waiting on.
    Outcome Await() const {
        if (ready_) {
            return *ready_;
        }
        return state_->Wait();
    }

    // ========================================================================
    // Continuations
    // ========================================================================

    // Runs inline when resolved, otherwise on the completing thread
    void OnComplete(Callback callback) const {
        if (ready_) {
            callback(*ready_);
            return;
        }
        state_->OnComplete(std::move(callback));
    }

    template <typename F>
    auto Map(F func) const -> Deferred<std::invoke_result_t<F&, const T&>> {
        using U = std::invoke_result_t<F&, const T&>;

        if (auto now = Poll()) {
            if (now->IsErr()) {
                return Deferred<U>::Failed(now->Error());
            }
            return Deferred<U>(func(now->Value()));
        }

        Promise<U> promise;
        Deferred<U> mapped = promise.GetDeferred();
        state_->OnComplete([promise, func = std::move(func)](const Outcome& outcome) mutable {
            if (outcome.IsErr()) {
                promise.Complete(Err(outcome.Error()));
                return;
            }
            promise.Complete(Ok(func(outcome.Value())));
        });
        return mapped;
    }

    // `func` returns a Deferred<U>; the result resolves once that one does
    template <typename F>
    auto FlatMap(F func) const -> std::invoke_result_t<F&, const T&> {
        using Next = std::invoke_result_t<F&, const T&>;
        using U = typename Next::value_type;

        if (auto now = Poll()) {
            if (now->IsErr()) {
                return Next::Failed(now->Error());
            }
            return func(now->Value());
        }

        Promise<U> promise;
        Next chained = promise.GetDeferred();
        state_->OnComplete([promise, func = std::move(func)](const Outcome& outcome) mutable {
            if (outcome.IsErr()) {
                promise.Complete(Err(outcome.Error()));
                return;
            }
            func(outcome.Value()).OnComplete(
                [promise](const Result<U, Error>& inner) mutable { promise.Complete(inner); });
        });
        return chained;
    }

   private:
    Deferred() = default;

    std::optional<Outcome> ready_;
    std::shared_ptr<DeferredState<T>> state_;
};

// ============================================================================
// Promise<T> - Write side of a pending Deferred
// ============================================================================
//
// Copies share one completion slot. When the last copy goes away without
// having completed it, the Deferred fails with Errc::BrokenPromise so that
// nobody waits forever.
//
template <typename T>
class Promise {
   public:
    using Outcome = Result<T, Error>;

    Promise() : core_(std::make_shared<Core>()) {}

    [[nodiscard]] Deferred<T> GetDeferred() const { return Deferred<T>(core_->state); }

    // Completing twice is a programming error
    void Complete(Outcome outcome) const {
        bool first = core_->state->Complete(std::move(outcome));
        RIVULET_CHECK(first, "Promise completed twice");
    }

    void Succeed(T value) const { Complete(Ok(std::move(value))); }

    void Fail(Error error) const { Complete(Err(error)); }

    // For racing producers: returns false if another one got there first
    bool TryComplete(Outcome outcome) const { return core_->state->Complete(std::move(outcome)); }

    [[nodiscard]] bool IsCompleted() const { return core_->state->IsCompleted(); }

   private:
    struct Core {
        std::shared_ptr<DeferredState<T>> state = std::make_shared<DeferredState<T>>();

        Core() = default;
        Core(const Core&) = delete;
        Core& operator=(const Core&) = delete;

        ~Core() { state->Complete(Err(make_error_code(Errc::BrokenPromise))); }
    };

    std::shared_ptr<Core> core_;
};

}  // namespace rivulet
