#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <type_traits>

#include "backoff.hpp"
#include "decision.hpp"
#include "log.hpp"

namespace again {

template <class T>
inline constexpr bool _is_expected_v = false;

template <class T, class E>
inline constexpr bool _is_expected_v<std::expected<T, E>> = true;

// Outcome of one attempt: std::expected<T, E>
template <class R>
concept attempt_result = _is_expected_v<std::remove_cvref_t<R>>;

// Consults the strategy about the failure of attempt number `attempt` (1-based). Both engines
// take every decision through here; strategy exceptions propagate to the caller.
template <class E, backoff_strategy<E> B>
auto next_step(B& strategy, const E& error, std::size_t attempt) -> decision {
  auto step = strategy.next(error);
  if (step.is_halt()) {
    logger()->info("again: attempt {} failed, giving up", attempt);
  } else {
    logger()->debug("again: attempt {} failed, retrying in {:.3f}ms", attempt,
                    std::chrono::duration<double, std::milli>(step.delay()).count());
  }
  return step;
}

}  // namespace again
