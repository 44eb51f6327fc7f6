// ============================================================================
// rivulet/reactive/consumers.hpp - Subscribing Applications to Streams
// ============================================================================
//
// The two ways application code attaches to an Observable:
//
//   Subscribe(source, scheduler, on_next, on_error, on_complete)
//       Callback consumer that answers every element with Continue. An
//       omitted on_error sends the error to scheduler.ReportFailure().
//
//   First(source, scheduler) -> Deferred<T>
//       The first element, after which the source is told to Stop. An empty
//       stream fails the result with Errc::NoSuchElement; an upstream error
//       fails it with that error.
//
// USAGE:
// ------
//   TestExecutor executor;
//   Scheduler scheduler(executor);
//
//   Cancelable c = Subscribe(Take(source, 10), scheduler,
//                            [&](int x) { sum += x; },
//                            nullptr,
//                            [&] { done = true; });
//
//   Deferred<int> head = First(source, scheduler);
//   executor.Tick();
//   auto outcome = head.Poll();
//
// ============================================================================

#pragma once

#include "rivulet/core/ack.hpp"
#include "rivulet/core/cancelable.hpp"
#include "rivulet/core/deferred.hpp"
#include "rivulet/reactive/observable.hpp"

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace rivulet {

namespace detail {

template <typename T>
class CallbackSubscriber final : public Subscriber<T> {
   public:
    CallbackSubscriber(Scheduler scheduler, std::function<void(T)> on_next, std::function<void(Error)> on_error,
                       std::function<void()> on_complete)
        : scheduler_(std::move(scheduler)),
          on_next_(std::move(on_next)),
          on_error_(std::move(on_error)),
          on_complete_(std::move(on_complete)) {}

    const Scheduler& GetScheduler() const override { return scheduler_; }

    AckFuture OnNext(T elem) override {
        on_next_(std::move(elem));
        return Ack::Continue;
    }

    void OnError(Error error) override {
        if (on_error_) {
            on_error_(error);
            return;
        }
        scheduler_.ReportFailure(error);
    }

    void OnComplete() override {
        if (on_complete_) {
            on_complete_();
        }
    }

   private:
    Scheduler scheduler_;
    std::function<void(T)> on_next_;
    std::function<void(Error)> on_error_;
    std::function<void()> on_complete_;
};

template <typename T>
class FirstSubscriber final : public Subscriber<T> {
   public:
    FirstSubscriber(Scheduler scheduler, Promise<T> promise)
        : scheduler_(std::move(scheduler)), promise_(std::move(promise)) {}

    const Scheduler& GetScheduler() const override { return scheduler_; }

    AckFuture OnNext(T elem) override {
        if (!done_) {
            done_ = true;
            promise_.Succeed(std::move(elem));
        }
        return Ack::Stop;
    }

    void OnError(Error error) override {
        if (!done_) {
            done_ = true;
            promise_.Fail(error);
        }
    }

    void OnComplete() override {
        if (!done_) {
            done_ = true;
            promise_.Fail(make_error_code(Errc::NoSuchElement));
        }
    }

   private:
    Scheduler scheduler_;
    Promise<T> promise_;
    bool done_ = false;
};

}  // namespace detail

template <typename T>
Cancelable Subscribe(const ObservablePtr<T>& source, const Scheduler& scheduler,
                     std::function<void(std::type_identity_t<T>)> on_next,
                     std::function<void(Error)> on_error = nullptr, std::function<void()> on_complete = nullptr) {
    return source->UnsafeSubscribeFn(std::make_shared<detail::CallbackSubscriber<T>>(
        scheduler, std::move(on_next), std::move(on_error), std::move(on_complete)));
}

template <typename T>
Deferred<T> First(const ObservablePtr<T>& source, const Scheduler& scheduler) {
    Promise<T> promise;
    Deferred<T> result = promise.GetDeferred();
    source->UnsafeSubscribeFn(std::make_shared<detail::FirstSubscriber<T>>(scheduler, std::move(promise)));
    return result;
}

}  // namespace rivulet
