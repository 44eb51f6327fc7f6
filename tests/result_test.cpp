// ============================================================================
// Result Type Tests
// ============================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>

#include "rivulet/core/error.hpp"
#include "rivulet/core/result.hpp"

using namespace rivulet;

namespace {

using StepOutcome = Result<std::pair<int, long>, Error>;

// A state-action step that refuses negative states
StepOutcome CountStep(long state) {
    if (state < 0) return Err(make_error_code(Errc::StepFailed));
    return Ok(std::make_pair(static_cast<int>(state), state + 1));
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(ResultTest, StepProducesElementAndNextState) {
    StepOutcome step = CountStep(7);

    ASSERT_TRUE(step.IsOk());
    EXPECT_FALSE(step.IsErr());
    EXPECT_TRUE(static_cast<bool>(step));
    EXPECT_EQ(step.Value().first, 7);
    EXPECT_EQ(step.Value().second, 8L);
}

TEST(ResultTest, StepFailureCarriesErrorCode) {
    StepOutcome step = CountStep(-1);

    ASSERT_TRUE(step.IsErr());
    EXPECT_FALSE(static_cast<bool>(step));
    EXPECT_EQ(step.Error(), make_error_code(Errc::StepFailed));
    EXPECT_EQ(&step.Error().category(), &RivuletCategory());
}

TEST(ResultTest, ForeignErrorCodesPassThrough) {
    Result<int, Error> r = Err(std::make_error_code(std::errc::timed_out));

    ASSERT_TRUE(r.IsErr());
    EXPECT_EQ(r.Error(), std::errc::timed_out);
}

TEST(ResultTest, UnitOutcome) {
    Result<Unit, Error> done = Ok();

    EXPECT_TRUE(done.IsOk());
    EXPECT_EQ(done.Value(), Unit{});
}

TEST(ResultTest, ValueOrFallsBackOnError) {
    Result<int, Error> ok = Ok(3);
    Result<int, Error> failed = Err(make_error_code(Errc::NoSuchElement));

    EXPECT_EQ(ok.ValueOr(-1), 3);
    EXPECT_EQ(failed.ValueOr(-1), -1);
}

// ============================================================================
// Combinators
// ============================================================================

TEST(ResultTest, MapKeepsOnlyTheElement) {
    auto element = CountStep(4).Map([](std::pair<int, long>&& p) { return p.first * 10; });
    ASSERT_TRUE(element.IsOk());
    EXPECT_EQ(element.Value(), 40);

    auto failed = CountStep(-4).Map([](std::pair<int, long>&& p) { return p.first * 10; });
    ASSERT_TRUE(failed.IsErr());
    EXPECT_EQ(failed.Error(), make_error_code(Errc::StepFailed));
}

TEST(ResultTest, MapOnConstRef) {
    const Result<std::string, Error> label = Ok(std::string("sep"));

    auto sized = label.Map([](const std::string& s) { return s.size(); });
    ASSERT_TRUE(sized.IsOk());
    EXPECT_EQ(sized.Value(), 3u);
    EXPECT_EQ(label.Value(), "sep");
}

TEST(ResultTest, AndThenRunsSuccessiveSteps) {
    auto r = CountStep(0)
                 .AndThen([](std::pair<int, long>&& p) { return CountStep(p.second); })
                 .AndThen([](std::pair<int, long>&& p) { return CountStep(p.second); });

    ASSERT_TRUE(r.IsOk());
    EXPECT_EQ(r.Value().first, 2);
    EXPECT_EQ(r.Value().second, 3L);
}

TEST(ResultTest, AndThenStopsAtFirstFailure) {
    int later_steps = 0;
    auto r = CountStep(-5).AndThen([&](std::pair<int, long>&& p) {
        ++later_steps;
        return CountStep(p.second);
    });

    EXPECT_EQ(later_steps, 0);
    ASSERT_TRUE(r.IsErr());
    EXPECT_EQ(r.Error(), make_error_code(Errc::StepFailed));
}

// ============================================================================
// Comparison and Ownership
// ============================================================================

TEST(ResultTest, EqualityComparesActiveAlternative) {
    EXPECT_EQ(CountStep(1), CountStep(1));
    EXPECT_NE(CountStep(1), CountStep(2));
    EXPECT_NE(CountStep(1), CountStep(-1));
    EXPECT_EQ(CountStep(-1), CountStep(-2));
}

TEST(ResultTest, MoveOnlyPayload) {
    Result<std::unique_ptr<int>, Error> owned = Ok(std::make_unique<int>(42));

    auto moved = std::move(owned);
    ASSERT_TRUE(moved.IsOk());
    EXPECT_EQ(*moved.Value(), 42);

    std::unique_ptr<int> taken = std::move(moved).Value();
    EXPECT_EQ(*taken, 42);
}
