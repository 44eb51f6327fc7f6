// ============================================================================
// rivulet/io/scheduler.hpp - Executor plus Fairness Policy
// ============================================================================
//
// A Scheduler is what a Subscriber carries as its scheduling context. It
// bundles three things a producer needs to decide how to proceed:
//
//   - an Executor to post continuations and trampolined loops to
//   - the ExecutionModel that says when such a post is mandatory
//   - a failure reporter for errors that have no subscriber left to go to
//
// Schedulers are small values: copying one shares the executor.
//
// USAGE:
// ------
//   ThreadPoolExecutor pool(4);
//   Scheduler scheduler(pool);
//   Scheduler async_everywhere = scheduler.WithExecutionModel(ExecutionModel::AlwaysAsync());
//
//   Scheduler::Options opts;
//   opts.failure_reporter = [](const Error& e) { errors.push_back(e); };
//   Scheduler quiet(pool, opts);
//
// ============================================================================

#pragma once

#include "rivulet/core/error.hpp"
#include "rivulet/core/execution_model.hpp"
#include "rivulet/io/executor.hpp"

#include <chrono>
#include <functional>

namespace rivulet {

class Scheduler {
   public:
    using FailureReporter = std::function<void(const Error&)>;

    struct Options {
        ExecutionModel execution_model = ExecutionModel::Default();

        // Empty means "write one line to stderr"
        FailureReporter failure_reporter;

        Options() = default;
    };

    explicit Scheduler(Executor& executor);
    Scheduler(Executor& executor, Options options);

    // Queue `task` on the executor
    void Execute(std::function<void()> task) const;

    void ExecuteAfter(std::chrono::milliseconds delay, std::function<void()> task) const;

    [[nodiscard]] const ExecutionModel& GetExecutionModel() const noexcept { return execution_model_; }

    [[nodiscard]] Executor& GetExecutor() const noexcept { return *executor_; }

    // Same executor and reporter, different batching policy
    [[nodiscard]] Scheduler WithExecutionModel(ExecutionModel model) const;

    void ReportFailure(const Error& error) const;

   private:
    Executor* executor_;
    ExecutionModel execution_model_;
    FailureReporter failure_reporter_;
};

}  // namespace rivulet
