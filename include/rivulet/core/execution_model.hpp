// ============================================================================
// rivulet/core/execution_model.hpp - Synchronous Batching Policy
// ============================================================================
//
// An ExecutionModel tells a producer how many steps it may run back to back
// on the current call stack before it must hand the rest of its work to the
// scheduler. The handoff bounds stack depth and lets other tasks queued on
// the same executor run in between.
//
// MODELS:
// -------
//   Synchronous()  - never forces a boundary (batch size 2^30)
//   AlwaysAsync()  - every step is a boundary, including the first
//   Batched(n)     - a boundary every n frames, n rounded up to a power of 2
//   Default()      - Batched(kDefaultBatchSize)
//
// FRAME INDEX:
// ------------
// Simple producers keep a frame counter and advance it with
// NextFrameIndex(); a result of 0 means "yield now". Producers that spend
// two fairness units per element (the async state-action generator) use
// BatchLimit() instead, which is half the batch size.
//
// ============================================================================

#pragma once

#include <cstddef>

namespace rivulet {

class ExecutionModel {
   public:
    enum class Kind {
        Synchronous,
        AlwaysAsync,
        Batched,
    };

    static constexpr size_t kDefaultBatchSize = 1024;
    static constexpr size_t kSynchronousBatchSize = size_t{1} << 30;

    [[nodiscard]] static ExecutionModel Synchronous();
    [[nodiscard]] static ExecutionModel AlwaysAsync();
    [[nodiscard]] static ExecutionModel Batched(size_t batch_size);
    [[nodiscard]] static ExecutionModel Default();

    [[nodiscard]] Kind GetKind() const noexcept { return kind_; }
    [[nodiscard]] bool IsAlwaysAsync() const noexcept { return kind_ == Kind::AlwaysAsync; }
    [[nodiscard]] bool IsSynchronous() const noexcept { return kind_ == Kind::Synchronous; }

    [[nodiscard]] size_t RecommendedBatchSize() const noexcept { return batch_size_; }
    [[nodiscard]] size_t BatchedExecutionModulus() const noexcept { return batch_size_ - 1; }

    // Advance a frame counter; 0 means an async boundary is due
    [[nodiscard]] size_t NextFrameIndex(size_t current) const noexcept;

    // Synchronous steps a two-unit-per-element producer may run per quantum
    [[nodiscard]] size_t BatchLimit() const noexcept;

    [[nodiscard]] bool CanContinueSync(size_t batch_count) const noexcept { return batch_count < BatchLimit(); }

    friend bool operator==(const ExecutionModel& a, const ExecutionModel& b) noexcept {
        return a.kind_ == b.kind_ && a.batch_size_ == b.batch_size_;
    }

   private:
    ExecutionModel(Kind kind, size_t batch_size) noexcept : kind_(kind), batch_size_(batch_size) {}

    Kind kind_;
    size_t batch_size_;
};

}  // namespace rivulet
