// ============================================================================
// Consumer Tests: Subscribe and First
// ============================================================================

#include "rivulet/core/error.hpp"
#include "rivulet/io/scheduler.hpp"
#include "rivulet/io/test_executor.hpp"
#include "rivulet/reactive/builders/from_iterable.hpp"
#include "rivulet/reactive/consumers.hpp"
#include "rivulet/reactive/operators/intersperse.hpp"
#include "test_observers.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace rivulet;
using namespace rivulet::testing;

class ConsumersTest : public ::testing::Test {
   protected:
    TestExecutor executor_;
    Scheduler scheduler_{executor_};
};

// ============================================================================
// Subscribe
// ============================================================================

TEST_F(ConsumersTest, SubscribeCollectsEverything) {
    std::string joined;
    bool done = false;

    Subscribe(
        Intersperse(FromIterable<std::string>({"a", "b", "c"}), "[", ",", "]"), scheduler_,
        [&](const std::string& s) { joined += s; }, nullptr, [&] { done = true; });
    executor_.Tick();

    EXPECT_EQ(joined, "[a,b,c]");
    EXPECT_TRUE(done);
}

TEST_F(ConsumersTest, SubscribeForwardsErrorToHandler) {
    std::vector<Error> errors;

    Subscribe(
        RaiseError<int>(make_error_code(Errc::StepFailed)), scheduler_, [](int) {},
        [&](Error e) { errors.push_back(e); });

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], make_error_code(Errc::StepFailed));
}

TEST_F(ConsumersTest, SubscribeWithoutErrorHandlerReports) {
    std::vector<Error> reported;
    Scheduler::Options options;
    options.failure_reporter = [&](const Error& e) { reported.push_back(e); };
    Scheduler reporting(executor_, options);

    Subscribe(RaiseError<int>(make_error_code(Errc::StepFailed)), reporting, [](int) {});

    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0], make_error_code(Errc::StepFailed));
}

// ============================================================================
// First
// ============================================================================

TEST_F(ConsumersTest, FirstTakesHeadAndStops) {
    auto source = std::make_shared<ManualSource<int>>();

    Deferred<int> head = First(ObservablePtr<int>(source), scheduler_);
    EXPECT_FALSE(head.IsReady());

    EXPECT_TRUE(IsResolvedTo(source->Push(4), Ack::Stop));
    ASSERT_TRUE(head.IsReady());
    EXPECT_EQ(head.Poll()->Value(), 4);
}

TEST_F(ConsumersTest, FirstOfEmptyFails) {
    Deferred<int> head = First(Empty<int>(), scheduler_);

    ASSERT_TRUE(head.IsReady());
    ASSERT_TRUE(head.Poll()->IsErr());
    EXPECT_EQ(head.Poll()->Error(), make_error_code(Errc::NoSuchElement));
}

TEST_F(ConsumersTest, FirstPassesUpstreamError) {
    Deferred<int> head = First(RaiseError<int>(std::make_error_code(std::errc::io_error)), scheduler_);

    ASSERT_TRUE(head.IsReady());
    EXPECT_EQ(head.Poll()->Error(), std::make_error_code(std::errc::io_error));
}

TEST_F(ConsumersTest, FirstOfIntersperseIsStartMarker) {
    Deferred<std::string> head =
        First(Intersperse(FromIterable<std::string>({"x", "y"}), "S0", "SEP", "E0"), scheduler_);

    ASSERT_TRUE(head.IsReady());
    EXPECT_EQ(head.Poll()->Value(), "S0");
}
