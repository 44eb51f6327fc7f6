// ============================================================================
// execution_test.cpp - Tests for P2300 std::execution adapters
// ============================================================================

#ifdef RIVULET_HAS_STDEXEC

#include "rivulet/core/error.hpp"
#include "rivulet/execution/deferred_sender.hpp"
#include "rivulet/execution/scheduler.hpp"
#include "rivulet/io/scheduler.hpp"
#include "rivulet/io/thread_pool_executor.hpp"
#include "rivulet/reactive/builders/async_state_action.hpp"
#include "rivulet/reactive/builders/from_iterable.hpp"
#include "rivulet/reactive/consumers.hpp"

#include <gtest/gtest.h>
#include <stdexec/execution.hpp>
#include <thread>
#include <utility>

using namespace rivulet;

// ============================================================================
// Scheduler Tests
// ============================================================================

TEST(ExecutionTest, SchedulerEquality) {
    ThreadPoolExecutor pool1(1);
    ThreadPoolExecutor pool2(1);
    Scheduler a(pool1);
    Scheduler b(pool1);
    Scheduler c(pool2);

    EXPECT_EQ(execution::AsStdScheduler(a), execution::AsStdScheduler(b));
    EXPECT_NE(execution::AsStdScheduler(a), execution::AsStdScheduler(c));
}

TEST(ExecutionTest, ScheduleRunsOnPool) {
    ThreadPoolExecutor pool(2);
    Scheduler scheduler(pool);

    auto sender = stdexec::schedule(execution::AsStdScheduler(scheduler)) |
                  stdexec::then([] { return std::this_thread::get_id(); });
    auto [worker] = stdexec::sync_wait(std::move(sender)).value();

    EXPECT_NE(worker, std::this_thread::get_id());
}

// ============================================================================
// Deferred Sender Tests
// ============================================================================
// sync_wait() would throw on set_error, so every pipeline below ends in
// upon_error to keep the library buildable with -fno-exceptions.

TEST(ExecutionTest, ResolvedDeferredCompletesInline) {
    auto sender = execution::AsSender(Deferred<int>(7)) | stdexec::upon_error([](Error) { return -1; });
    auto [value] = stdexec::sync_wait(std::move(sender)).value();
    EXPECT_EQ(value, 7);
}

TEST(ExecutionTest, FailedDeferredReachesUponError) {
    auto sender = execution::AsSender(Deferred<int>::Failed(make_error_code(Errc::StepFailed))) |
                  stdexec::upon_error([](Error e) { return e == make_error_code(Errc::StepFailed) ? -1 : -2; });
    auto [value] = stdexec::sync_wait(std::move(sender)).value();

    EXPECT_EQ(value, -1);
}

TEST(ExecutionTest, FirstOfGeneratorAsSender) {
    ThreadPoolExecutor pool(2);
    Scheduler scheduler(pool, [] {
        Scheduler::Options options;
        options.execution_model = ExecutionModel::AlwaysAsync();
        return options;
    }());

    auto source = FromAsyncStateAction(3, [](int s) { return Deferred<std::pair<int, int>>(std::make_pair(s * s, s)); });
    auto sender = execution::AsSender(First(source, scheduler)) | stdexec::then([](int x) { return x + 1; }) |
                  stdexec::upon_error([](Error) { return -1; });
    auto [value] = stdexec::sync_wait(std::move(sender)).value();

    EXPECT_EQ(value, 10);
}

#endif  // RIVULET_HAS_STDEXEC
