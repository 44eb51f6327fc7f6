// ============================================================================
// rivulet/execution/deferred_sender.hpp - Deferred<T> -> P2300 Sender
// ============================================================================
//
// AsSender(deferred) turns a Deferred<T>, for instance the result of
// First(), into a sender that completes with set_value(T) on success and
// set_error(Error) on failure. Completion happens on whichever thread
// resolves the Deferred, or inside start() when it is already resolved.
//
// USAGE:
// ------
//   auto [first] = stdexec::sync_wait(
//       execution::AsSender(First(source, scheduler))).value();
//
// Note that sync_wait() rethrows set_error(); under -fno-exceptions use
// stdexec::then / upon_error instead of relying on it for failures.
//
// ============================================================================

#pragma once

#include "rivulet/core/deferred.hpp"
#include "rivulet/core/error.hpp"

#include <stdexec/execution.hpp>
#include <utility>

namespace rivulet::execution {

template <typename T, typename Receiver>
class DeferredOperation {
   public:
    DeferredOperation(Deferred<T> deferred, Receiver rcvr) noexcept
        : deferred_(std::move(deferred)), receiver_(std::move(rcvr)) {}

    DeferredOperation(DeferredOperation&&) = delete;
    DeferredOperation& operator=(DeferredOperation&&) = delete;

    void start() noexcept {
        deferred_.OnComplete([this](const Result<T, Error>& outcome) {
            if (outcome.IsErr()) {
                stdexec::set_error(std::move(receiver_), outcome.Error());
                return;
            }
            stdexec::set_value(std::move(receiver_), outcome.Value());
        });
    }

   private:
    Deferred<T> deferred_;
    Receiver receiver_;
};

template <typename T>
class DeferredSender {
   public:
    using sender_concept = stdexec::sender_t;

    explicit DeferredSender(Deferred<T> deferred) noexcept : deferred_(std::move(deferred)) {}

    template <class Receiver>
    auto connect(Receiver rcvr) const noexcept -> DeferredOperation<T, Receiver> {
        return DeferredOperation<T, Receiver>{deferred_, std::move(rcvr)};
    }

    template <class, class...>
    static consteval auto get_completion_signatures() noexcept {
        return stdexec::completion_signatures<stdexec::set_value_t(T), stdexec::set_error_t(Error)>{};
    }

   private:
    Deferred<T> deferred_;
};

template <typename T>
DeferredSender<T> AsSender(Deferred<T> deferred) noexcept {
    return DeferredSender<T>{std::move(deferred)};
}

}  // namespace rivulet::execution
