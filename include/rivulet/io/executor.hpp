// ============================================================================
// rivulet/io/executor.hpp - Task Queue Interface
// ============================================================================
//
// An Executor runs queued work. Streams never run their own threads; when a
// producer has to give up the call stack (an execution-model boundary, an
// acknowledgment that arrived on a foreign thread) it posts the rest of its
// loop to an Executor, usually through a Scheduler.
//
// Two implementations ship with the library:
//   ThreadPoolExecutor - worker threads plus a timer thread
//   TestExecutor       - single-threaded, virtual time, advanced by hand
//
// The interface also accepts coroutine handles so that Task-based step
// functions can suspend onto the same queue (see ScheduleOn).
//
// ============================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <functional>

namespace rivulet {

class Executor {
   public:
    virtual ~Executor() = default;

    // Run until Stop() is called or the queue drains
    virtual void Run() = 0;

    // Run what is ready right now without blocking
    virtual void RunOnce() = 0;

    virtual void Stop() = 0;

    [[nodiscard]] virtual bool IsRunning() const = 0;

    // Resume a suspended coroutine as soon as possible
    virtual void Schedule(std::coroutine_handle<> handle) = 0;

    // Resume a suspended coroutine once `delay` has elapsed
    virtual void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) = 0;

    // Queue a callback
    virtual void Post(std::function<void()> callback) = 0;

    // Queue a callback to run once `delay` has elapsed
    virtual void PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) = 0;
};

// ============================================================================
// Thread-local current executor
// ============================================================================
// Set while an executor is running work on this thread, so that awaitables
// can find it without being handed one.

[[nodiscard]] Executor* GetCurrentExecutor();

void SetCurrentExecutor(Executor* executor);

// Installs an executor as current for a scope and restores the previous one
class ExecutorGuard {
   public:
    explicit ExecutorGuard(Executor* executor);
    ~ExecutorGuard();

    ExecutorGuard(const ExecutorGuard&) = delete;
    ExecutorGuard& operator=(const ExecutorGuard&) = delete;

   private:
    Executor* previous_;
};

}  // namespace rivulet
