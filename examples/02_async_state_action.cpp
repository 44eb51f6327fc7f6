// ============================================================================
// Example 02: Async State-Action Generator
// ============================================================================
//
// Unfolds the Fibonacci sequence from a (a, b) state and shows how the
// execution model decides how much runs before the first yield:
//
//   Batched(8)    4 elements on the subscribing thread, then 4 per task
//   AlwaysAsync   nothing until the executor runs, then one per task
//
// RUN:
//   cd build && ./02_async_state_action
//
// ============================================================================

#include "rivulet/rivulet.hpp"

#include <iostream>
#include <utility>

using namespace rivulet;

using FibState = std::pair<long long, long long>;

static Deferred<std::pair<long long, FibState>> FibStep(FibState s) {
    return Deferred<std::pair<long long, FibState>>::Now(std::make_pair(s.first, FibState{s.second, s.first + s.second}));
}

static void Trace(const char* title, const ExecutionModel& model) {
    std::cout << "--- " << title << " ---" << std::endl;

    TestExecutor executor;
    Scheduler scheduler = Scheduler(executor).WithExecutionModel(model);
    int delivered = 0;

    Subscribe(
        Take(FromAsyncStateAction(FibState{0, 1}, FibStep), 12), scheduler,
        [&](long long x) {
            ++delivered;
            std::cout << "  " << x;
        },
        nullptr, [] { std::cout << "  | done"; });
    std::cout << std::endl << "  (" << delivered << " delivered before the executor ran)" << std::endl;

    int tick = 0;
    while (executor.TickOne()) {
        std::cout << "  after task " << ++tick << ": " << delivered << " delivered" << std::endl;
    }
    std::cout << std::endl;
}

int main() {
    std::cout << "=== Rivulet Example 02: Async State-Action ===" << std::endl;
    std::cout << std::endl;

    Trace("Batched(8)", ExecutionModel::Batched(8));
    Trace("AlwaysAsync", ExecutionModel::AlwaysAsync());

    return 0;
}
