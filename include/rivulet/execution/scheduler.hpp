// ============================================================================
// rivulet/execution/scheduler.hpp - Scheduler -> P2300 Scheduler Adapter
// ============================================================================
//
// Wraps a rivulet::Scheduler as a P2300 scheduler so that sender pipelines
// can hop onto the same executor a stream runs on.
//
// schedule() posts through Scheduler::Execute() and completes with
// set_value(), or with set_stopped() when the receiver's stop token was
// triggered before the posted task ran.
//
// USAGE:
// ------
//   auto sched = execution::AsStdScheduler(scheduler);
//   auto sender = stdexec::schedule(sched)
//               | stdexec::then([] { return 42; });
//
// ============================================================================

#pragma once

#include "rivulet/io/scheduler.hpp"

#include <stdexec/execution.hpp>
#include <utility>

namespace rivulet::execution {

class StreamScheduler;

template <typename Receiver>
class ScheduleOperation {
   public:
    ScheduleOperation(Scheduler scheduler, Receiver rcvr) noexcept
        : scheduler_(std::move(scheduler)), receiver_(std::move(rcvr)) {}

    ScheduleOperation(ScheduleOperation&&) = delete;
    ScheduleOperation& operator=(ScheduleOperation&&) = delete;

    void start() noexcept {
        scheduler_.Execute([this] {
            if constexpr (stdexec::unstoppable_token<stdexec::stop_token_of_t<stdexec::env_of_t<Receiver>>>) {
                stdexec::set_value(std::move(receiver_));
            } else if (stdexec::get_stop_token(stdexec::get_env(receiver_)).stop_requested()) {
                stdexec::set_stopped(std::move(receiver_));
            } else {
                stdexec::set_value(std::move(receiver_));
            }
        });
    }

   private:
    Scheduler scheduler_;
    Receiver receiver_;
};

class ScheduleSender {
   public:
    using sender_concept = stdexec::sender_t;

    explicit ScheduleSender(Scheduler scheduler) noexcept : scheduler_(std::move(scheduler)) {}

    template <class Receiver>
    auto connect(Receiver rcvr) const noexcept -> ScheduleOperation<Receiver> {
        return ScheduleOperation<Receiver>{scheduler_, std::move(rcvr)};
    }

    template <class, class...>
    static consteval auto get_completion_signatures() noexcept {
        return stdexec::completion_signatures<stdexec::set_value_t(), stdexec::set_stopped_t()>{};
    }

   private:
    Scheduler scheduler_;
};

// Two adapters compare equal when they post to the same executor
class StreamScheduler {
   public:
    using scheduler_concept = stdexec::scheduler_t;

    explicit StreamScheduler(Scheduler scheduler) noexcept : scheduler_(std::move(scheduler)) {}

    [[nodiscard]] auto schedule() const noexcept -> ScheduleSender { return ScheduleSender{scheduler_}; }

    friend bool operator==(const StreamScheduler& a, const StreamScheduler& b) noexcept {
        return &a.scheduler_.GetExecutor() == &b.scheduler_.GetExecutor();
    }

   private:
    Scheduler scheduler_;
};

inline StreamScheduler AsStdScheduler(const Scheduler& scheduler) noexcept {
    return StreamScheduler{scheduler};
}

}  // namespace rivulet::execution
