#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <thread>
#include <type_traits>
#include <utility>

#include "backoff.hpp"
#include "decision.hpp"
#include "policies.hpp"
#include "step.hpp"

namespace again {

// ============================================================================
// retry - blocking retry loop on the calling thread
// ============================================================================

struct thread_sleeper {
  void operator()(duration delay) const {
    std::this_thread::sleep_for(delay);
  }
};

template <class Op>
using operation_result_t = std::remove_cvref_t<std::invoke_result_t<Op&>>;

// Invokes `operation` until it succeeds or `strategy` halts, sleeping through `sleeper` between
// attempts. Returns the first success or the error of the attempt that made the strategy halt.
// A strategy that never halts keeps retrying for as long as the operation fails.
template <class B, class Op, class Sleeper = thread_sleeper>
  requires std::invocable<Op&> && attempt_result<std::invoke_result_t<Op&>>
           && backoff_strategy<B, typename operation_result_t<Op>::error_type>
           && std::invocable<Sleeper&, duration>
auto retry(B strategy, Op&& operation, Sleeper sleeper = {}) -> operation_result_t<Op> {
  for (std::size_t attempt = 1;; ++attempt) {
    operation_result_t<Op> result = std::invoke(operation);
    if (result.has_value()) {
      return result;
    }
    auto step = next_step(strategy, result.error(), attempt);
    if (step.is_halt()) {
      return result;
    }
    if (step.delay() > duration::zero()) {
      std::invoke(sleeper, step.delay());
    }
  }
}

// Like retry(), but errors rejected by `predicate(error, attempt)` end the session at once.
// retry_async_if() is the sender counterpart.
template <class B, class Op, class Pred>
  requires std::invocable<Op&> && attempt_result<std::invoke_result_t<Op&>>
auto retry_if(B strategy, Op&& operation, Pred predicate) -> operation_result_t<Op> {
  return retry(retry_when(std::move(strategy), std::move(predicate)), std::forward<Op>(operation));
}

}  // namespace again
