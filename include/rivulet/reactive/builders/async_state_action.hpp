// ============================================================================
// rivulet/reactive/builders/async_state_action.hpp - Unfold with Async Steps
// ============================================================================
//
// FromAsyncStateAction(seed, step) builds an infinite stream by unfolding a
// state:
//
//   step(seed) -> (a0, s1)
//   step(s1)   -> (a1, s2)
//   ...
//
// `step` takes the state by value and returns either
//   - Deferred<std::pair<A, S>>, resolved now or later, possibly failed, or
//   - Task<Result<std::pair<A, S>, Error>>, started immediately through
//     FromTask(); a task that never suspends counts as resolved now.
//
// Every subscription starts again from its own copy of `seed`. The stream
// never completes by itself; bound it with Take() or cancel it.
//
// SCHEDULING:
// -----------
// The loop runs on the subscriber's Scheduler and follows its
// ExecutionModel:
//
//   Batched(n)    up to BatchLimit() == n / 2 steps run inline, then the
//                 loop resubmits itself to the executor (trampoline). The
//                 hop counts as one frame, so every resubmitted batch runs
//                 BatchLimit() - 1 steps (at least one)
//   AlwaysAsync   every step, the first one included, is its own task
//   Synchronous   effectively never yields
//
// A step that is still pending when returned ends the current batch: its
// continuation delivers the element and, once the answer is Continue, queues
// the next step as a new task. The same goes for an acknowledgment that is
// not known yet.
//
// CANCELLATION:
// -------------
// Cancel() raises a flag that is checked before every step, before every
// queued continuation and before delivering a late result. Once raised,
// nothing else reaches the subscriber, OnComplete and OnError included.
//
// ============================================================================

#pragma once

#include "rivulet/core/ack.hpp"
#include "rivulet/core/cancelable.hpp"
#include "rivulet/core/deferred.hpp"
#include "rivulet/core/from_task.hpp"
#include "rivulet/core/task.hpp"
#include "rivulet/reactive/observable.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace rivulet {

namespace detail {

// ============================================================================
// Step result shapes
// ============================================================================

template <typename R>
struct StepTraits;

template <typename A, typename S>
struct StepTraits<Deferred<std::pair<A, S>>> {
    using Element = A;
    using State = S;
};

template <typename A, typename S>
struct StepTraits<Task<Result<std::pair<A, S>, Error>>> {
    using Element = A;
    using State = S;
};

template <typename F, typename S>
using StepElement = typename StepTraits<std::invoke_result_t<F&, S>>::Element;

// ============================================================================
// AsyncStateActionLoop - One subscription's generator
// ============================================================================
//
// Owned through shared_ptr by the subscription's Cancelable and by whatever
// continuation is currently pending. Fields other than cancelled_ are only
// touched by the one logical thread the acknowledgment chain allows.
//
template <typename S, typename A>
class AsyncStateActionLoop final : public std::enable_shared_from_this<AsyncStateActionLoop<S, A>> {
   public:
    using Produced = std::pair<A, S>;
    using Step = std::function<Deferred<Produced>(S)>;

    AsyncStateActionLoop(S seed, Step step, std::shared_ptr<Subscriber<A>> out)
        : state_(std::move(seed)), step_(std::move(step)), out_(std::move(out)) {}

    void Start() {
        if (Model().IsAlwaysAsync()) {
            ScheduleNext();
            return;
        }
        RunBatch();
    }

    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

   private:
    const ExecutionModel& Model() const { return out_->GetScheduler().GetExecutionModel(); }

    // Synchronous part of the loop. Returns as soon as anything is pending
    // or the batch allowance is used up.
    void RunBatch() {
        while (!IsCancelled()) {
            Deferred<Produced> next = step_(state_);

            auto outcome = next.Poll();
            if (!outcome) {
                auto self = this->shared_from_this();
                next.OnComplete([self](const Result<Produced, Error>& late) { self->OnLateStep(late); });
                return;
            }
            if (outcome->IsErr()) {
                SignalError(outcome->Error());
                return;
            }
            if (IsCancelled()) {
                return;
            }

            AckFuture ack = Deliver(std::move(*outcome).Value());
            if (!IsSyncContinue(ack)) {
                AwaitAck(ack);
                return;
            }
            if (!Model().CanContinueSync(batch_count_)) {
                ScheduleNext();
                return;
            }
        }
    }

    AckFuture Deliver(Produced produced) {
        state_ = std::move(produced.second);
        ++batch_count_;
        return out_->OnNext(std::move(produced.first));
    }

    // A step that was pending has resolved, possibly on another thread
    void OnLateStep(const Result<Produced, Error>& outcome) {
        if (IsCancelled()) {
            return;
        }
        if (outcome.IsErr()) {
            SignalError(outcome.Error());
            return;
        }
        batch_count_ = 0;
        AwaitAck(Deliver(outcome.Value()));
    }

    // Continue goes through the executor; Stop ends the loop. A failed
    // acknowledgment also ends it and has nowhere to go but the reporter.
    void AwaitAck(const AckFuture& ack) {
        auto self = this->shared_from_this();
        ack.OnComplete([self](const Result<Ack, Error>& answer) {
            if (answer.IsErr()) {
                self->out_->GetScheduler().ReportFailure(answer.Error());
                return;
            }
            if (answer.Value() == Ack::Continue && !self->IsCancelled()) {
                self->ScheduleNext();
            }
        });
    }

    // Trampoline: the next batch starts from the executor's stack. The hop
    // itself uses up one frame of the new batch.
    void ScheduleNext() {
        auto self = this->shared_from_this();
        out_->GetScheduler().Execute([self] {
            if (self->IsCancelled()) {
                return;
            }
            self->batch_count_ = 1;
            self->RunBatch();
        });
    }

    void SignalError(const Error& error) {
        if (!IsCancelled()) {
            out_->OnError(error);
        }
    }

    S state_;
    Step step_;
    std::shared_ptr<Subscriber<A>> out_;
    size_t batch_count_ = 0;
    std::atomic<bool> cancelled_{false};
};

}  // namespace detail

// ============================================================================
// AsyncStateActionObservable
// ============================================================================
template <typename S, typename A>
class AsyncStateActionObservable final : public Observable<A> {
   public:
    using Step = typename detail::AsyncStateActionLoop<S, A>::Step;

    AsyncStateActionObservable(S seed, Step step) : seed_(std::move(seed)), step_(std::move(step)) {}

    Cancelable UnsafeSubscribeFn(std::shared_ptr<Subscriber<A>> subscriber) override {
        auto loop = std::make_shared<detail::AsyncStateActionLoop<S, A>>(seed_, step_, std::move(subscriber));
        loop->Start();
        return Cancelable([loop] { loop->Cancel(); });
    }

   private:
    S seed_;
    Step step_;
};

template <typename S, typename F>
ObservablePtr<detail::StepElement<F, S>> FromAsyncStateAction(S seed, F step) {
    using A = detail::StepElement<F, S>;
    using Returned = std::invoke_result_t<F&, S>;

    if constexpr (std::is_same_v<Returned, Deferred<std::pair<A, S>>>) {
        return std::make_shared<AsyncStateActionObservable<S, A>>(std::move(seed), std::move(step));
    } else {
        return std::make_shared<AsyncStateActionObservable<S, A>>(
            std::move(seed), [step = std::move(step)](S state) mutable { return FromTask(step(std::move(state))); });
    }
}

}  // namespace rivulet
