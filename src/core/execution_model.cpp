// ============================================================================
// rivulet/core/execution_model.cpp - Execution Model Arithmetic
// ============================================================================

#include "rivulet/core/execution_model.hpp"

#include "rivulet/core/check.hpp"

#include <algorithm>

namespace rivulet {

namespace {

size_t RoundUpToPowerOfTwo(size_t n) {
    size_t power = 1;
    while (power < n) {
        power <<= 1;
    }
    return power;
}

}  // namespace

ExecutionModel ExecutionModel::Synchronous() {
    return ExecutionModel{Kind::Synchronous, kSynchronousBatchSize};
}

ExecutionModel ExecutionModel::AlwaysAsync() {
    return ExecutionModel{Kind::AlwaysAsync, 1};
}

ExecutionModel ExecutionModel::Batched(size_t batch_size) {
    RIVULET_CHECK(batch_size <= kSynchronousBatchSize, "Batched execution model size out of range");
    return ExecutionModel{Kind::Batched, RoundUpToPowerOfTwo(std::max<size_t>(batch_size, 1))};
}

ExecutionModel ExecutionModel::Default() {
    return Batched(kDefaultBatchSize);
}

size_t ExecutionModel::NextFrameIndex(size_t current) const noexcept {
    switch (kind_) {
        case Kind::Synchronous:
            return 1;
        case Kind::AlwaysAsync:
            return 0;
        case Kind::Batched:
            break;
    }
    return (current + 1) & BatchedExecutionModulus();
}

size_t ExecutionModel::BatchLimit() const noexcept {
    if (kind_ == Kind::AlwaysAsync) {
        return 0;
    }
    return std::max<size_t>(batch_size_ / 2, 1);
}

}  // namespace rivulet
