// ============================================================================
// rivulet/reactive/observer.hpp - Consumer Side of the Stream Protocol
// ============================================================================
//
// An Observer receives a stream one signal at a time:
//
//   OnNext(elem)   -> AckFuture   zero or more times
//   OnComplete()                  at most once, or
//   OnError(error)                at most once, never both
//
// PROTOCOL (what producers guarantee, so observers need no locks):
// ---------------------------------------------------------------
// 1. OnNext is never called again before the AckFuture returned by the
//    previous call resolved to Continue. After Stop, nothing follows.
// 2. At most one call is active at a time, although consecutive calls may
//    happen on different threads.
// 3. A terminal signal never overtakes an unresolved acknowledgment.
//
// A Subscriber is an Observer bound to the Scheduler that producers use to
// post continuations and to read the execution model from.
//
// ============================================================================

#pragma once

#include "rivulet/core/ack.hpp"
#include "rivulet/core/error.hpp"
#include "rivulet/io/scheduler.hpp"

namespace rivulet {

template <typename T>
class Observer {
   public:
    virtual ~Observer() = default;

    virtual AckFuture OnNext(T elem) = 0;

    virtual void OnError(Error error) = 0;

    virtual void OnComplete() = 0;
};

template <typename T>
class Subscriber : public Observer<T> {
   public:
    [[nodiscard]] virtual const Scheduler& GetScheduler() const = 0;
};

}  // namespace rivulet
