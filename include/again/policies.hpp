#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <utility>

#include "backoff.hpp"
#include "decision.hpp"

namespace again {

// ============================================================================
// with_max_attempts - bounds a session to a number of attempts
// ============================================================================

template <class B>
class max_attempts_backoff {
 public:
  max_attempts_backoff(B inner, std::size_t max_attempts)
      : inner_(std::move(inner)), max_attempts_(max_attempts) {
    if (max_attempts_ == 0) {
      throw std::invalid_argument("Max attempts must be >= 1.");
    }
  }

  // The failure of attempt `max_attempts` halts without consulting the wrapped strategy
  template <class E>
    requires backoff_strategy<B, E>
  auto next(const E& error) -> decision {
    if (++failures_ >= max_attempts_) {
      return decision::halt();
    }
    return inner_.next(error);
  }

 private:
  B           inner_;
  std::size_t max_attempts_;
  std::size_t failures_ = 0;
};

template <class B>
auto with_max_attempts(B inner, std::size_t max_attempts) -> max_attempts_backoff<B> {
  return max_attempts_backoff<B>{std::move(inner), max_attempts};
}

// ============================================================================
// retry_when - halts as soon as the predicate rejects an error
// ============================================================================

template <class B, class Pred>
class predicate_backoff {
 public:
  predicate_backoff(B inner, Pred predicate)
      : inner_(std::move(inner)), predicate_(std::move(predicate)) {}

  // `predicate(error, attempt)` sees the 1-based number of the attempt that failed
  template <class E>
    requires backoff_strategy<B, E> && std::predicate<Pred&, const E&, std::size_t>
  auto next(const E& error) -> decision {
    if (!std::invoke(predicate_, error, ++failures_)) {
      return decision::halt();
    }
    return inner_.next(error);
  }

 private:
  B           inner_;
  Pred        predicate_;
  std::size_t failures_ = 0;
};

template <class B, class Pred>
auto retry_when(B inner, Pred predicate) -> predicate_backoff<B, Pred> {
  return predicate_backoff<B, Pred>{std::move(inner), std::move(predicate)};
}

}  // namespace again
