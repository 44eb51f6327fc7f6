// ============================================================================
// Example 04: std::execution Bridge
// ============================================================================
//
// Hands the first element of a stream to a P2300 pipeline and hops onto the
// stream's executor with stdexec::schedule().
//
// BUILD:
//   cmake -B build -DENABLE_STDEXEC=ON && cmake --build build
//
// ============================================================================

#include "rivulet/rivulet.hpp"

#include <iostream>
#include <stdexec/execution.hpp>
#include <utility>

using namespace rivulet;

int main() {
    std::cout << "=== Rivulet Example 04: stdexec Bridge ===" << std::endl;

    ThreadPoolExecutor pool(2);
    Scheduler scheduler(pool);

    auto squares = FromAsyncStateAction(
        4, [](int n) { return Deferred<std::pair<int, int>>(std::make_pair(n * n, n + 1)); });

    auto pipeline = execution::AsSender(First(squares, scheduler)) | stdexec::then([](int x) { return x + 1; }) |
                    stdexec::upon_error([](Error) { return -1; });
    auto [value] = stdexec::sync_wait(std::move(pipeline)).value();
    std::cout << "  first square + 1 = " << value << std::endl;

    auto hop = stdexec::schedule(execution::AsStdScheduler(scheduler)) | stdexec::then([] { return 42; });
    auto [answer] = stdexec::sync_wait(std::move(hop)).value();
    std::cout << "  computed on the pool: " << answer << std::endl;

    return 0;
}
