// ============================================================================
// rivulet/core/from_task.hpp - Task → Deferred Bridge
// ============================================================================
//
// FromTask() starts a Task<Result<T, Error>> immediately on the calling
// thread and returns a Deferred<T> for its outcome. A task that reaches
// co_return without ever suspending yields an already-resolved Deferred, so
// coroutine steps keep the generator's synchronous fast path.
//
// The task runs inside a self-destroying bridge coroutine that owns it; the
// Deferred stays valid after the bridge is gone.
//
// ============================================================================

#pragma once

#include "rivulet/core/deferred.hpp"
#include "rivulet/core/result.hpp"
#include "rivulet/core/task.hpp"

#include <coroutine>
#include <cstdlib>
#include <utility>

namespace rivulet {

namespace detail {

// Eager and fire-and-forget: runs on creation, frees its frame at the end
struct TaskBridge {
    struct promise_type {
        TaskBridge get_return_object() noexcept { return {}; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void return_void() noexcept {}
        void unhandled_exception() noexcept { std::abort(); }
    };
};

template <typename T>
TaskBridge RunTaskInto(Task<Result<T, Error>> task, Promise<T> promise) {
    Result<T, Error> outcome = co_await std::move(task);
    promise.Complete(std::move(outcome));
}

}  // namespace detail

template <typename T>
Deferred<T> FromTask(Task<Result<T, Error>> task) {
    Promise<T> promise;
    Deferred<T> deferred = promise.GetDeferred();
    detail::RunTaskInto<T>(std::move(task), std::move(promise));
    return deferred;
}

}  // namespace rivulet
