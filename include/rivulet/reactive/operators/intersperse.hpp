// ============================================================================
// rivulet/reactive/operators/intersperse.hpp - Start / Separator / End Markers
// ============================================================================
//
// Intersperse(source, start, separator, end) emits `start` before the first
// element, `separator` between consecutive elements and `end` after normal
// completion:
//
//   source:  x       y         z       |
//   output:  S0  x   SEP  y    SEP  z  E0  |
//
// Markers are only emitted around real elements. An empty source produces
// just the terminal signal; an error is forwarded without `end`.
//
// BACK-PRESSURE:
// --------------
// Every upstream element turns into two downstream sends. The second is
// issued only after the first was answered with Continue, and the upstream
// receives the chained answer, so it cannot run ahead. The chained answer
// is also remembered: OnError/OnComplete wait for it before going
// downstream, and are dropped if it was Stop.
//
// ============================================================================

#pragma once

#include "rivulet/core/ack.hpp"
#include "rivulet/core/cancelable.hpp"
#include "rivulet/reactive/observable.hpp"

#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace rivulet {

namespace detail {

template <typename T>
class IntersperseSubscriber final : public Subscriber<T> {
   public:
    IntersperseSubscriber(std::shared_ptr<Subscriber<T>> out, std::optional<T> start, T separator,
                          std::optional<T> end)
        : out_(std::move(out)), start_(std::move(start)), separator_(std::move(separator)), end_(std::move(end)) {}

    const Scheduler& GetScheduler() const override { return out_->GetScheduler(); }

    AckFuture OnNext(T elem) override {
        AckFuture marker_ack = Ack::Continue;
        if (!at_least_one_) {
            at_least_one_ = true;
            if (start_) {
                marker_ack = out_->OnNext(*start_);
            }
        } else {
            marker_ack = out_->OnNext(separator_);
        }

        downstream_ack_ =
            SyncFlatMap(marker_ack, [out = out_, elem = std::move(elem)](Ack ack) mutable -> AckFuture {
                if (ack != Ack::Continue) {
                    return ack;
                }
                return out->OnNext(std::move(elem));
            });
        return downstream_ack_;
    }

    void OnError(Error error) override {
        SyncOnContinue(downstream_ack_, [out = out_, error] { out->OnError(error); });
    }

    void OnComplete() override {
        std::optional<T> end = at_least_one_ ? end_ : std::nullopt;
        SyncOnContinue(downstream_ack_, [out = out_, end = std::move(end)] {
            if (!end) {
                out->OnComplete();
                return;
            }
            SyncOnContinue(out->OnNext(*end), [out] { out->OnComplete(); });
        });
    }

   private:
    std::shared_ptr<Subscriber<T>> out_;
    std::optional<T> start_;
    T separator_;
    std::optional<T> end_;

    bool at_least_one_ = false;
    AckFuture downstream_ack_ = Ack::Continue;
};

}  // namespace detail

template <typename T>
class IntersperseObservable final : public Observable<T> {
   public:
    IntersperseObservable(ObservablePtr<T> source, std::optional<T> start, T separator, std::optional<T> end)
        : source_(std::move(source)), start_(std::move(start)), separator_(std::move(separator)), end_(std::move(end)) {}

    Cancelable UnsafeSubscribeFn(std::shared_ptr<Subscriber<T>> subscriber) override {
        auto inner = std::make_shared<detail::IntersperseSubscriber<T>>(std::move(subscriber), start_, separator_, end_);
        Cancelable upstream = source_->UnsafeSubscribeFn(std::move(inner));
        return Cancelable([upstream]() mutable { upstream.Cancel(); });
    }

   private:
    ObservablePtr<T> source_;
    std::optional<T> start_;
    T separator_;
    std::optional<T> end_;
};

// Separator only
template <typename T>
ObservablePtr<T> Intersperse(ObservablePtr<T> source, std::type_identity_t<T> separator) {
    return std::make_shared<IntersperseObservable<T>>(std::move(source), std::nullopt, std::move(separator),
                                                      std::nullopt);
}

template <typename T>
ObservablePtr<T> Intersperse(ObservablePtr<T> source, std::type_identity_t<T> start,
                             std::type_identity_t<T> separator, std::type_identity_t<T> end) {
    return std::make_shared<IntersperseObservable<T>>(std::move(source), std::move(start), std::move(separator),
                                                      std::move(end));
}

}  // namespace rivulet
