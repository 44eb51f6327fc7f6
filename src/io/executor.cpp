// ============================================================================
// rivulet/io/executor.cpp - Current Executor Tracking
// ============================================================================

#include "rivulet/io/executor.hpp"

namespace rivulet {

static thread_local Executor* t_current_executor = nullptr;

Executor* GetCurrentExecutor() {
    return t_current_executor;
}

void SetCurrentExecutor(Executor* executor) {
    t_current_executor = executor;
}

ExecutorGuard::ExecutorGuard(Executor* executor) : previous_(t_current_executor) {
    t_current_executor = executor;
}

ExecutorGuard::~ExecutorGuard() {
    t_current_executor = previous_;
}

}  // namespace rivulet
