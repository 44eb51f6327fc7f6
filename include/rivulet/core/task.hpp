// ============================================================================
// rivulet/core/task.hpp - Lazy Coroutine for Step Functions
// ============================================================================
//
// Task<T> is a lazily started coroutine producing one T. In rivulet it is
// the second way to write a state-action step: instead of returning a
// Deferred, a step may be a coroutine returning
// Task<Result<std::pair<A, S>, Error>> and co_await whatever it needs
// (ScheduleOn an executor, another Task, ...). FromTask() turns it into a
// Deferred for the generator loop.
//
// LIFECYCLE:
// ----------
// 1. Creating a Task runs nothing (initial_suspend is suspend_always).
// 2. co_await starts it; the awaiting coroutine becomes its continuation.
// 3. At final_suspend control transfers straight back to the continuation.
// 4. The Task object owns the frame and destroys it.
//
// Exceptions are not used: unhandled_exception() aborts, failures belong in
// a Result.
//
// USAGE:
// ------
//   Task<Result<std::pair<int, long>, Error>> Step(long seed) {
//       co_await ScheduleOn(pool);
//       co_return Ok(std::make_pair(static_cast<int>(seed), seed + 1));
//   }
//
// ============================================================================

#pragma once

#include "rivulet/core/check.hpp"
#include "rivulet/core/coroutine_compat.hpp"

#include <coroutine>
#include <cstdlib>
#include <optional>
#include <utility>

namespace rivulet {

template <typename T>
class Task;

namespace detail {

// ============================================================================
// TaskPromiseBase - Continuation bookkeeping shared by all Task promises
// ============================================================================
class TaskPromiseBase {
   public:
    struct FinalAwaiter {
        bool await_ready() noexcept { return false; }

        template <typename Promise>
        SymmetricTransferResult await_suspend(std::coroutine_handle<Promise> finishing) noexcept {
            TaskPromiseBase& base = finishing.promise();
            std::coroutine_handle<> continuation = base.continuation_;
            return SymmetricTransfer(continuation ? continuation : std::noop_coroutine());
        }

        void await_resume() noexcept {}
    };

    std::suspend_always initial_suspend() noexcept { return {}; }

    FinalAwaiter final_suspend() noexcept { return {}; }

    void unhandled_exception() noexcept { std::abort(); }

    void SetContinuation(std::coroutine_handle<> continuation) noexcept {
        RIVULET_CHECK(!awaited_, "Task co_awaited twice");
        awaited_ = true;
        continuation_ = continuation;
    }

   private:
    std::coroutine_handle<> continuation_;
    bool awaited_ = false;
};

}  // namespace detail

template <typename T>
class TaskPromise : public detail::TaskPromiseBase {
   public:
    Task<T> get_return_object() noexcept;

    void return_value(T value) noexcept { result_.emplace(std::move(value)); }

    T TakeResult() noexcept { return std::move(*result_); }

   private:
    std::optional<T> result_;
};

template <>
class TaskPromise<void> : public detail::TaskPromiseBase {
   public:
    Task<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void TakeResult() noexcept {}
};

// ============================================================================
// Task<T>
// ============================================================================
template <typename T>
class [[nodiscard("Task must be co_awaited")]] Task {
   public:
    using promise_type = TaskPromise<T>;
    using Handle = std::coroutine_handle<promise_type>;

    explicit Task(Handle handle) noexcept : handle_(handle) {}

    ~Task() {
        if (handle_) {
            handle_.destroy();
        }
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    struct Awaiter {
        Handle handle_;

        bool await_ready() noexcept { return false; }

        // Record who is waiting, then jump into the task body
        SymmetricTransferResult await_suspend(std::coroutine_handle<> awaiting) noexcept {
            handle_.promise().SetContinuation(awaiting);
            return SymmetricTransfer(handle_);
        }

        T await_resume() noexcept { return handle_.promise().TakeResult(); }
    };

    Awaiter operator co_await() noexcept { return Awaiter{handle_}; }

    [[nodiscard]] Handle GetHandle() const noexcept { return handle_; }

   private:
    Handle handle_;
};

template <typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{Task<T>::Handle::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{Task<void>::Handle::from_promise(*this)};
}

}  // namespace rivulet
