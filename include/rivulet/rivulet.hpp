// ============================================================================
// rivulet/rivulet.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete rivulet library.
// For smaller builds, include individual headers as needed.
//
// USAGE:
// ------
//   #include <rivulet/rivulet.hpp>
//   using namespace rivulet;
//
// ============================================================================

#pragma once

// Core primitives
#include "rivulet/core/ack.hpp"
#include "rivulet/core/cancelable.hpp"
#include "rivulet/core/deferred.hpp"
#include "rivulet/core/error.hpp"
#include "rivulet/core/execution_model.hpp"
#include "rivulet/core/result.hpp"

// Coroutines
#include "rivulet/core/from_task.hpp"
#include "rivulet/core/schedule_on.hpp"
#include "rivulet/core/task.hpp"

// Executors
#include "rivulet/io/executor.hpp"
#include "rivulet/io/scheduler.hpp"
#include "rivulet/io/test_executor.hpp"
#include "rivulet/io/thread_pool_executor.hpp"

// Streams
#include "rivulet/reactive/builders/async_state_action.hpp"
#include "rivulet/reactive/builders/from_iterable.hpp"
#include "rivulet/reactive/consumers.hpp"
#include "rivulet/reactive/observable.hpp"
#include "rivulet/reactive/observer.hpp"
#include "rivulet/reactive/operators/intersperse.hpp"
#include "rivulet/reactive/operators/take.hpp"

// std::execution interop
#ifdef RIVULET_HAS_STDEXEC
#include "rivulet/execution/deferred_sender.hpp"
#include "rivulet/execution/scheduler.hpp"
#endif
