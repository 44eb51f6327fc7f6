// ============================================================================
// Execution Model Tests
// ============================================================================

#include "rivulet/core/execution_model.hpp"

#include <gtest/gtest.h>

using namespace rivulet;

TEST(ExecutionModelTest, DefaultIsBatched1024) {
    ExecutionModel model = ExecutionModel::Default();
    EXPECT_EQ(model.GetKind(), ExecutionModel::Kind::Batched);
    EXPECT_EQ(model.RecommendedBatchSize(), 1024u);
    EXPECT_EQ(model.BatchedExecutionModulus(), 1023u);
    EXPECT_EQ(model, ExecutionModel::Batched(1024));
}

TEST(ExecutionModelTest, BatchedRoundsUpToPowerOfTwo) {
    EXPECT_EQ(ExecutionModel::Batched(1000).RecommendedBatchSize(), 1024u);
    EXPECT_EQ(ExecutionModel::Batched(3).RecommendedBatchSize(), 4u);
    EXPECT_EQ(ExecutionModel::Batched(0).RecommendedBatchSize(), 1u);
    EXPECT_EQ(ExecutionModel::Batched(1).RecommendedBatchSize(), 1u);
}

TEST(ExecutionModelTest, BatchedFrameIndexWraps) {
    ExecutionModel model = ExecutionModel::Batched(4);
    EXPECT_EQ(model.NextFrameIndex(0), 1u);
    EXPECT_EQ(model.NextFrameIndex(1), 2u);
    EXPECT_EQ(model.NextFrameIndex(2), 3u);
    EXPECT_EQ(model.NextFrameIndex(3), 0u);
}

TEST(ExecutionModelTest, BatchLimitIsHalfTheBatch) {
    EXPECT_EQ(ExecutionModel::Default().BatchLimit(), 512u);
    EXPECT_EQ(ExecutionModel::Batched(4).BatchLimit(), 2u);
    EXPECT_EQ(ExecutionModel::Batched(1).BatchLimit(), 1u);

    ExecutionModel model = ExecutionModel::Batched(8);
    EXPECT_TRUE(model.CanContinueSync(0));
    EXPECT_TRUE(model.CanContinueSync(3));
    EXPECT_FALSE(model.CanContinueSync(4));
}

TEST(ExecutionModelTest, AlwaysAsyncNeverContinues) {
    ExecutionModel model = ExecutionModel::AlwaysAsync();
    EXPECT_TRUE(model.IsAlwaysAsync());
    EXPECT_EQ(model.BatchLimit(), 0u);
    EXPECT_FALSE(model.CanContinueSync(0));
    EXPECT_EQ(model.NextFrameIndex(0), 0u);
    EXPECT_EQ(model.NextFrameIndex(7), 0u);
}

TEST(ExecutionModelTest, SynchronousNeverYields) {
    ExecutionModel model = ExecutionModel::Synchronous();
    EXPECT_TRUE(model.IsSynchronous());
    EXPECT_EQ(model.NextFrameIndex(0), 1u);
    EXPECT_EQ(model.NextFrameIndex(1u << 20), 1u);
    EXPECT_TRUE(model.CanContinueSync(1u << 20));
}

TEST(ExecutionModelTest, Equality) {
    EXPECT_EQ(ExecutionModel::Synchronous(), ExecutionModel::Synchronous());
    EXPECT_NE(ExecutionModel::Synchronous(), ExecutionModel::AlwaysAsync());
    EXPECT_NE(ExecutionModel::Batched(4), ExecutionModel::Batched(8));
    EXPECT_NE(ExecutionModel::AlwaysAsync(), ExecutionModel::Batched(1));
}

TEST(ExecutionModelDeathTest, OversizedBatchAborts) {
    EXPECT_DEATH((void)ExecutionModel::Batched((size_t{1} << 30) + 1), "out of range");
}
