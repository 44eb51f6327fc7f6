// ============================================================================
// rivulet/io/scheduler.cpp - Executor plus Fairness Policy
// ============================================================================

#include "rivulet/io/scheduler.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace rivulet {

namespace {

void WriteFailureToStderr(const Error& error) {
    std::string line = "rivulet: unhandled failure: ";
    line += error.category().name();
    line += ": ";
    line += error.message();
    line += "\n";
    std::fputs(line.c_str(), stderr);
}

}  // namespace

Scheduler::Scheduler(Executor& executor) : Scheduler(executor, Options{}) {}

Scheduler::Scheduler(Executor& executor, Options options)
    : executor_(&executor),
      execution_model_(options.execution_model),
      failure_reporter_(std::move(options.failure_reporter)) {}

void Scheduler::Execute(std::function<void()> task) const {
    executor_->Post(std::move(task));
}

void Scheduler::ExecuteAfter(std::chrono::milliseconds delay, std::function<void()> task) const {
    executor_->PostAfter(delay, std::move(task));
}

Scheduler Scheduler::WithExecutionModel(ExecutionModel model) const {
    Scheduler copy = *this;
    copy.execution_model_ = model;
    return copy;
}

void Scheduler::ReportFailure(const Error& error) const {
    if (failure_reporter_) {
        failure_reporter_(error);
        return;
    }
    WriteFailureToStderr(error);
}

}  // namespace rivulet
