// ============================================================================
// rivulet/reactive/observable.hpp - Producer Side of the Stream Protocol
// ============================================================================
//
// An Observable is a recipe for a stream. Each UnsafeSubscribeFn() call
// starts an independent subscription feeding `subscriber` and returns the
// Cancelable that stops it.
//
// "Unsafe" because the caller is trusted to pass a well-behaved subscriber
// and the implementation is trusted to follow the protocol described in
// observer.hpp; nothing is checked at runtime. Applications normally go
// through Subscribe() or First() in consumers.hpp instead.
//
// Operators are observables that subscribe an inner Subscriber to their
// source and forward to the outer one, so back-pressure travels back
// through the chain and Cancel() travels up it.
//
// ============================================================================

#pragma once

#include "rivulet/core/cancelable.hpp"
#include "rivulet/reactive/observer.hpp"

#include <memory>

namespace rivulet {

template <typename T>
class Observable {
   public:
    virtual ~Observable() = default;

    virtual Cancelable UnsafeSubscribeFn(std::shared_ptr<Subscriber<T>> subscriber) = 0;
};

template <typename T>
using ObservablePtr = std::shared_ptr<Observable<T>>;

}  // namespace rivulet
