// ============================================================================
// rivulet/reactive/builders/from_iterable.hpp - Finite Sources
// ============================================================================
//
// FromIterable(items)   emits every element of `items` in order, then
//                       completes
// Empty<T>()            completes right away
// RaiseError<T>(error)  fails right away
//
// FromIterable honours back-pressure and the subscriber's ExecutionModel:
// it walks the vector with NextFrameIndex() and, whenever the frame index
// wraps to 0, resubmits the rest of the walk to the executor. OnComplete is
// sent only after the last element was answered with Continue.
//
// The vector is shared between subscriptions, never copied per subscriber.
//
// ============================================================================

#pragma once

#include "rivulet/core/ack.hpp"
#include "rivulet/core/cancelable.hpp"
#include "rivulet/reactive/observable.hpp"

#include <atomic>
#include <memory>
#include <utility>
#include <vector>

namespace rivulet {

namespace detail {

template <typename T>
class IterableLoop final : public std::enable_shared_from_this<IterableLoop<T>> {
   public:
    IterableLoop(std::shared_ptr<const std::vector<T>> items, std::shared_ptr<Subscriber<T>> out)
        : items_(std::move(items)), out_(std::move(out)) {}

    // The first element goes out on the subscribing thread
    void Start() { RunLoop(1); }

    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

   private:
    void RunLoop(size_t frame) {
        const ExecutionModel& model = out_->GetScheduler().GetExecutionModel();

        while (!IsCancelled()) {
            if (index_ == items_->size()) {
                out_->OnComplete();
                return;
            }
            if (frame == 0) {
                ScheduleNext();
                return;
            }

            AckFuture ack = out_->OnNext((*items_)[index_++]);
            if (!IsSyncContinue(ack)) {
                AwaitAck(ack);
                return;
            }
            frame = model.NextFrameIndex(frame);
        }
    }

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

    void ScheduleNext() {
        auto self = this->shared_from_this();
        out_->GetScheduler().Execute([self] {
            if (!self->IsCancelled()) {
                self->RunLoop(1);
            }
        });
    }

    std::shared_ptr<const std::vector<T>> items_;
    std::shared_ptr<Subscriber<T>> out_;
    size_t index_ = 0;
    std::atomic<bool> cancelled_{false};
};

}  // namespace detail

template <typename T>
class IterableObservable final : public Observable<T> {
   public:
    explicit IterableObservable(std::vector<T> items)
        : items_(std::make_shared<const std::vector<T>>(std::move(items))) {}

    Cancelable UnsafeSubscribeFn(std::shared_ptr<Subscriber<T>> subscriber) override {
        auto loop = std::make_shared<detail::IterableLoop<T>>(items_, std::move(subscriber));
        loop->Start();
        return Cancelable([loop] { loop->Cancel(); });
    }

   private:
    std::shared_ptr<const std::vector<T>> items_;
};

template <typename T>
class EmptyObservable final : public Observable<T> {
   public:
    Cancelable UnsafeSubscribeFn(std::shared_ptr<Subscriber<T>> subscriber) override {
        subscriber->OnComplete();
        return Cancelable::Empty();
    }
};

template <typename T>
class ErrorObservable final : public Observable<T> {
   public:
    explicit ErrorObservable(Error error) : error_(error) {}

    Cancelable UnsafeSubscribeFn(std::shared_ptr<Subscriber<T>> subscriber) override {
        subscriber->OnError(error_);
        return Cancelable::Empty();
    }

   private:
    Error error_;
};

template <typename T>
ObservablePtr<T> FromIterable(std::vector<T> items) {
    return std::make_shared<IterableObservable<T>>(std::move(items));
}

template <typename T>
ObservablePtr<T> Empty() {
    return std::make_shared<EmptyObservable<T>>();
}

template <typename T>
ObservablePtr<T> RaiseError(Error error) {
    return std::make_shared<ErrorObservable<T>>(error);
}

}  // namespace rivulet
