// ============================================================================
// Example 03: Coroutine Steps on a Thread Pool
// ============================================================================
//
// Each step of the generator is a Task that hops onto a thread pool before
// producing its element. The stream waits for every step, keeps the
// elements in order, and stops at the first failing step.
//
// RUN:
//   cd build && ./03_task_steps
//
// ============================================================================

#include "rivulet/rivulet.hpp"

#include <iostream>
#include <thread>
#include <utility>

using namespace rivulet;

static Task<Result<std::pair<int, int>, Error>> Countdown(Executor& pool, int remaining) {
    co_await ScheduleOn(pool);
    if (remaining == 0) {
        co_return Err(make_error_code(Errc::StepFailed));
    }
    co_return Ok(std::make_pair(remaining, remaining - 1));
}

int main() {
    std::cout << "=== Rivulet Example 03: Task Steps ===" << std::endl;

    ThreadPoolExecutor pool(2);
    Scheduler scheduler(pool);
    Executor* executor = &pool;

    auto source = FromAsyncStateAction(5, [executor](int remaining) { return Countdown(*executor, remaining); });

    Promise<Unit> finished;
    Subscribe(
        source, scheduler,
        [](int x) { std::cout << "  " << x << " (on thread " << std::this_thread::get_id() << ")" << std::endl; },
        [finished](Error e) {
            std::cout << "  stopped: " << e.message() << std::endl;
            finished.Succeed(Unit{});
        });

    finished.GetDeferred().Await();
    return 0;
}
