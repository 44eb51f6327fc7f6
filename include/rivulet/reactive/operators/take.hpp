// ============================================================================
// rivulet/reactive/operators/take.hpp - First N Elements
// ============================================================================
//
// Take(source, n) forwards the first n elements and then completes. This is
// how an infinite source such as FromAsyncStateAction is bounded.
//
// On the n-th element the upstream is answered with Stop straight away,
// while OnComplete goes downstream only once that element was accepted with
// Continue. Take(source, 0) completes without subscribing to `source`.
//
// ============================================================================

#pragma once

#include "rivulet/core/ack.hpp"
#include "rivulet/core/cancelable.hpp"
#include "rivulet/reactive/observable.hpp"

#include <cstdint>
#include <memory>
#include <utility>

namespace rivulet {

namespace detail {

template <typename T>
class TakeSubscriber final : public Subscriber<T> {
   public:
    TakeSubscriber(std::shared_ptr<Subscriber<T>> out, uint64_t limit) : out_(std::move(out)), limit_(limit) {}

    const Scheduler& GetScheduler() const override { return out_->GetScheduler(); }

    AckFuture OnNext(T elem) override {
        if (!active_) {
            return Ack::Stop;
        }

        ++counter_;
        if (counter_ < limit_) {
            return out_->OnNext(std::move(elem));
        }

        active_ = false;
        SyncOnContinue(out_->OnNext(std::move(elem)), [out = out_] { out->OnComplete(); });
        return Ack::Stop;
    }

    void OnError(Error error) override {
        if (active_) {
            active_ = false;
            out_->OnError(error);
        }
    }

    void OnComplete() override {
        if (active_) {
            active_ = false;
            out_->OnComplete();
        }
    }

   private:
    std::shared_ptr<Subscriber<T>> out_;
    uint64_t limit_;
    uint64_t counter_ = 0;
    bool active_ = true;
};

}  // namespace detail

template <typename T>
class TakeObservable final : public Observable<T> {
   public:
    TakeObservable(ObservablePtr<T> source, uint64_t limit) : source_(std::move(source)), limit_(limit) {}

    Cancelable UnsafeSubscribeFn(std::shared_ptr<Subscriber<T>> subscriber) override {
        if (limit_ == 0) {
            subscriber->OnComplete();
            return Cancelable::Empty();
        }
        return source_->UnsafeSubscribeFn(std::make_shared<detail::TakeSubscriber<T>>(std::move(subscriber), limit_));
    }

   private:
    ObservablePtr<T> source_;
    uint64_t limit_;
};

template <typename T>
ObservablePtr<T> Take(ObservablePtr<T> source, uint64_t n) {
    return std::make_shared<TakeObservable<T>>(std::move(source), n);
}

}  // namespace rivulet
