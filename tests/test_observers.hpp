// ============================================================================
// Test helpers: recording subscribers and a hand-driven source
// ============================================================================

#pragma once

#include "rivulet/core/ack.hpp"
#include "rivulet/core/cancelable.hpp"
#include "rivulet/core/deferred.hpp"
#include "rivulet/io/scheduler.hpp"
#include "rivulet/reactive/observable.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace rivulet::testing {

// Records every signal and answers each element with a fixed Ack
template <typename T>
class RecordingSubscriber : public Subscriber<T> {
   public:
    explicit RecordingSubscriber(Scheduler scheduler, Ack answer = Ack::Continue)
        : scheduler_(std::move(scheduler)), answer_(answer) {}

    const Scheduler& GetScheduler() const override { return scheduler_; }

    AckFuture OnNext(T elem) override {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(std::move(elem));
        return answer_;
    }

    void OnError(Error error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++terminal_signals_;
        error_ = error;
    }

    void OnComplete() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++terminal_signals_;
        completed_ = true;
    }

    std::vector<T> Received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    size_t Count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_.size();
    }

    bool Completed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }

    std::optional<Error> ReceivedError() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    int TerminalSignals() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminal_signals_;
    }

   private:
    Scheduler scheduler_;
    Ack answer_;
    mutable std::mutex mutex_;
    std::vector<T> received_;
    std::optional<Error> error_;
    bool completed_ = false;
    int terminal_signals_ = 0;
};

// Leaves every acknowledgment pending until the test answers it
template <typename T>
class ManualAckSubscriber : public RecordingSubscriber<T> {
   public:
    explicit ManualAckSubscriber(Scheduler scheduler) : RecordingSubscriber<T>(std::move(scheduler)) {}

    AckFuture OnNext(T elem) override {
        RecordingSubscriber<T>::OnNext(std::move(elem));
        Promise<Ack> promise;
        pending_.push_back(promise);
        return promise.GetDeferred();
    }

    size_t PendingAcks() const { return pending_.size(); }

    // Answers the oldest outstanding acknowledgment
    void Answer(Ack ack) {
        Promise<Ack> promise = pending_.front();
        pending_.pop_front();
        promise.Succeed(ack);
    }

    void FailAck(Error error) {
        Promise<Ack> promise = pending_.front();
        pending_.pop_front();
        promise.Fail(error);
    }

   private:
    std::deque<Promise<Ack>> pending_;
};

// A source the test pushes signals into by hand. Keeps the last ack it got
// back so the test can check what the upstream side observed.
template <typename T>
class ManualSource : public Observable<T> {
   public:
    Cancelable UnsafeSubscribeFn(std::shared_ptr<Subscriber<T>> subscriber) override {
        subscriber_ = std::move(subscriber);
        return Cancelable([this] { cancelled_ = true; });
    }

    AckFuture Push(T elem) { return subscriber_->OnNext(std::move(elem)); }

    void Complete() { subscriber_->OnComplete(); }

    void Fail(Error error) { subscriber_->OnError(error); }

    bool IsSubscribed() const { return subscriber_ != nullptr; }

    bool IsCancelled() const { return cancelled_; }

   private:
    std::shared_ptr<Subscriber<T>> subscriber_;
    bool cancelled_ = false;
};

// Outcome helpers for Deferred<Ack>
inline bool IsResolvedTo(const AckFuture& ack, Ack expected) {
    auto outcome = ack.Poll();
    return outcome.has_value() && outcome->IsOk() && outcome->Value() == expected;
}

}  // namespace rivulet::testing
