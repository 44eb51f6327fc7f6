// ============================================================================
// rivulet/core/ack.hpp - Back-Pressure Acknowledgment
// ============================================================================
//
// A consumer answers every element with an Ack: Continue asks for the next
// one, Stop ends the subscription. The answer may be deferred (the consumer
// is still thinking) which is why OnNext returns an AckFuture rather than a
// bare Ack.
//
// The helpers below are the two chaining shapes every operator needs. They
// take the synchronous path when the answer is already known, so a chain of
// operators over synchronous consumers never allocates a shared state.
//
// ============================================================================

#pragma once

#include "rivulet/core/deferred.hpp"

#include <utility>

namespace rivulet {

enum class Ack {
    Continue,
    Stop,
};

using AckFuture = Deferred<Ack>;

// True when the answer is known and is Continue
inline bool IsSyncContinue(const AckFuture& ack) {
    auto now = ack.Poll();
    return now.has_value() && now->IsOk() && now->Value() == Ack::Continue;
}

// ============================================================================
// SyncFlatMap - Continue the chain with another send
// ============================================================================
//
// `func` (Ack -> AckFuture) runs right away when `ack` is resolved and on the
// resolving thread otherwise. A failed ack skips `func` and stays failed.
//
template <typename F>
AckFuture SyncFlatMap(const AckFuture& ack, F func) {
    return ack.FlatMap([func = std::move(func)](const Ack& value) mutable -> AckFuture { return func(value); });
}

// ============================================================================
// SyncOnContinue - Run a side effect once the consumer says Continue
// ============================================================================
//
// Used to hold back a terminal signal until the last element was accepted.
// Never runs on Stop or on a failed ack.
//
template <typename F>
void SyncOnContinue(const AckFuture& ack, F callback) {
    ack.OnComplete([callback = std::move(callback)](const Result<Ack, Error>& outcome) mutable {
        if (outcome.IsOk() && outcome.Value() == Ack::Continue) {
            callback();
        }
    });
}

}  // namespace rivulet
