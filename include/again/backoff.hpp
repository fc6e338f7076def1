#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "decision.hpp"

namespace again {

// A stateful policy consulted once per failed attempt with that attempt's error
template <class B, class E>
concept backoff_strategy = std::move_constructible<B> && requires(B& b, const E& e) {
  { b.next(e) } -> std::same_as<decision>;
};

// ============================================================================
// Runtime polymorphism
// ============================================================================

template <class E>
class backoff {
 public:
  virtual ~backoff() = default;

  virtual auto next(const E& error) -> decision = 0;
};

// Owning, move-only handle to a strategy chosen at run time
template <class E>
class any_backoff {
 public:
  explicit any_backoff(std::unique_ptr<backoff<E>> impl) : impl_(std::move(impl)) {
    if (!impl_) {
      throw std::invalid_argument("any_backoff requires a strategy");
    }
  }

  template <class S>
    requires(!std::same_as<std::remove_cvref_t<S>, any_backoff>)
            && backoff_strategy<std::remove_cvref_t<S>, E>
  any_backoff(S&& strategy)  // NOLINT(google-explicit-constructor)
      : impl_(std::make_unique<_holder<std::remove_cvref_t<S>>>(std::forward<S>(strategy))) {}

  auto next(const E& error) -> decision {
    return impl_->next(error);
  }

 private:
  template <class S>
  struct _holder final : backoff<E> {
    S strategy_;

    explicit _holder(S s) : strategy_(std::move(s)) {}

    auto next(const E& error) -> decision override {
      return strategy_.next(error);
    }
  };

  std::unique_ptr<backoff<E>> impl_;
};

// ============================================================================
// Reference strategies
// ============================================================================

// Retries at once, forever
class immediate {
 public:
  template <class E>
  auto next(const E& /*unused*/) const noexcept -> decision {
    return decision::retry_after(duration::zero());
  }
};

// Retries after the same delay, forever
class constant {
 public:
  template <class Rep, class Period>
  explicit constant(std::chrono::duration<Rep, Period> delay)
      : delay_(std::chrono::duration_cast<duration>(delay)) {
    if (delay_ < duration::zero()) {
      throw std::invalid_argument("Constant backoff delay must be >= zero.");
    }
  }

  template <class E>
  auto next(const E& /*unused*/) const noexcept -> decision {
    return decision::retry_after(delay_);
  }

  [[nodiscard]] auto delay() const noexcept -> duration {
    return delay_;
  }

 private:
  duration delay_;
};

struct exponential_config {
  duration                   initial_delay = std::chrono::milliseconds(100);
  duration                   max_delay     = std::chrono::milliseconds(10000);
  double                     multiplier    = 2.0;
  std::optional<std::size_t> max_retries;  // unlimited when empty

  void validate() const {
    if (initial_delay < duration::zero()) {
      throw std::invalid_argument("Initial delay must be >= zero.");
    }
    if (max_delay < initial_delay) {
      throw std::invalid_argument("Max delay must be >= initial delay.");
    }
    if (!(multiplier >= 1.0)) {
      throw std::invalid_argument("Multiplier must be >= 1.");
    }
  }
};

// Delay grows by `multiplier` on every consultation, capped at `max_delay`. Halts once
// `max_retries` retries have been granted.
class exponential {
 public:
  exponential() : exponential(exponential_config{}) {}

  explicit exponential(const exponential_config& config)
      : config_((config.validate(), config)), current_delay_(config.initial_delay) {}

  template <class E>
  auto next(const E& /*unused*/) noexcept -> decision {
    if (config_.max_retries && retries_ >= *config_.max_retries) {
      return decision::halt();
    }
    ++retries_;
    auto delay = current_delay_;

    auto scaled    = static_cast<double>(current_delay_.count()) * config_.multiplier;
    current_delay_ = scaled >= static_cast<double>(config_.max_delay.count())
                         ? config_.max_delay
                         : duration(static_cast<duration::rep>(scaled));
    return decision::retry_after(delay);
  }

  [[nodiscard]] auto retries() const noexcept -> std::size_t {
    return retries_;
  }

  [[nodiscard]] auto config() const noexcept -> const exponential_config& {
    return config_;
  }

 private:
  exponential_config config_;
  duration           current_delay_;
  std::size_t        retries_ = 0;
};

}  // namespace again
