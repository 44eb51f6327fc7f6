// ============================================================================
// rivulet/core/schedule_on.hpp - Hop a Coroutine onto an Executor
// ============================================================================
//
// `co_await ScheduleOn(executor)` suspends the current coroutine and queues
// its resumption on `executor`. A Task-based step uses it to do its work
// asynchronously, which in turn makes the generator take its pending path.
//
// `co_await Yield()` does the same on the executor running the current
// thread, and resumes inline when there is none.
//
// ============================================================================

#pragma once

#include "rivulet/io/executor.hpp"

#include <coroutine>

namespace rivulet {

class ScheduleOnAwaitable {
   public:
    explicit ScheduleOnAwaitable(Executor& target) : target_(target) {}

    bool await_ready() const noexcept { return false; }

    void await_suspend(std::coroutine_handle<> handle) const { target_.Schedule(handle); }

    void await_resume() const noexcept {}

   private:
    Executor& target_;
};

inline ScheduleOnAwaitable ScheduleOn(Executor& target) {
    return ScheduleOnAwaitable{target};
}

class YieldAwaitable {
   public:
    bool await_ready() const noexcept { return false; }

    // Returning false resumes immediately when no executor is current
    bool await_suspend(std::coroutine_handle<> handle) const {
        Executor* executor = GetCurrentExecutor();
        if (executor == nullptr) {
            return false;
        }
        executor->Schedule(handle);
        return true;
    }

    void await_resume() const noexcept {}
};

inline YieldAwaitable Yield() {
    return {};
}

}  // namespace rivulet
