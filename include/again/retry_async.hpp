#pragma once

#include <concepts>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <variant>

#include "backoff.hpp"
#include "decision.hpp"
#include "execution/concepts.hpp"
#include "execution/stop_token.hpp"
#include "log.hpp"
#include "policies.hpp"
#include "step.hpp"

namespace again {

// ============================================================================
// retry_async - retry loop as a sender
// ============================================================================

namespace _retry_async_detail {

using namespace execution;

// Nested operation states are owned through a type-erased pointer: their types depend on
// receivers that point back into the state that owns them.
using _erased_op = std::unique_ptr<void, void (*)(void*)>;

inline auto _empty_op() noexcept -> _erased_op {
  return _erased_op(nullptr, +[](void* /*unused*/) {});
}

// Connects and starts `sndr` in `slot`. The operation previously held by the slot is released
// only after the new one has started.
template <class Sndr, class Rcvr>
void _launch(_erased_op& slot, Sndr&& sndr, Rcvr rcvr) {
  using op_t = decltype(execution::connect(std::forward<Sndr>(sndr), std::move(rcvr)));

  // Constructed in place: operation states need not be movable
  std::unique_ptr<op_t> op(
      new op_t(execution::connect(std::forward<Sndr>(sndr), std::move(rcvr))));  // NOLINT
  auto* started = op.get();
  auto  previous =
      std::exchange(slot, _erased_op(op.release(), +[](void* p) {
                      delete static_cast<op_t*>(p);  // NOLINT(cppcoreguidelines-owning-memory)
                    }));
  started->start();
}

enum class _phase : unsigned char { attempt, backoff, done };

template <class State>
struct _attempt_receiver {
  using receiver_concept = receiver_t;

  State* state_;

  template <class... Args>
    requires std::constructible_from<typename State::result_type, Args...>
  void set_value(Args&&... args) && noexcept {
    try {
      state_->on_result(typename State::result_type(std::forward<Args>(args)...));
    } catch (...) {
      state_->finish_error(std::current_exception());
    }
  }

  template <class E>
  void set_error(E&& e) && noexcept {
    if constexpr (std::same_as<std::remove_cvref_t<E>, std::exception_ptr>) {
      state_->finish_error(std::forward<E>(e));
    } else {
      state_->finish_error(std::make_exception_ptr(std::forward<E>(e)));
    }
  }

  void set_stopped() && noexcept {
    state_->finish_stopped();
  }

  auto get_env() const noexcept -> env_of_t<typename State::receiver_type> {
    return execution::get_env(state_->receiver_);
  }
};

template <class State>
struct _backoff_receiver {
  using receiver_concept = receiver_t;

  State* state_;

  void set_value() && noexcept {
    state_->advance(_phase::attempt);
  }

  template <class E>
  void set_error(E&& e) && noexcept {
    if constexpr (std::same_as<std::remove_cvref_t<E>, std::exception_ptr>) {
      state_->finish_error(std::forward<E>(e));
    } else {
      state_->finish_error(std::make_exception_ptr(std::forward<E>(e)));
    }
  }

  void set_stopped() && noexcept {
    state_->finish_stopped();
  }

  auto get_env() const noexcept -> env_of_t<typename State::receiver_type> {
    return execution::get_env(state_->receiver_);
  }
};

// One retry session. Exactly one nested operation (an attempt or a backoff wait) is in flight at
// a time. Completions that arrive while drive() is still starting the nested operation are picked
// up by drive() itself, so synchronous completions iterate instead of recursing.
template <class B, class F, class Sch, class Rcvr>
struct _retry_async_state {
  using receiver_type = Rcvr;
  using result_type   = single_value_t<std::invoke_result_t<F&>>;
  using error_type    = typename result_type::error_type;

  B    strategy_;
  F    factory_;
  Sch  scheduler_;
  Rcvr receiver_;

  _erased_op  attempt_op_ = _empty_op();
  _erased_op  backoff_op_ = _empty_op();
  std::size_t attempt_    = 0;
  duration    delay_      = duration::zero();

  // monostate: stopped
  std::variant<std::monostate, result_type, std::exception_ptr> outcome_;

  // Protects phase_, driving_ and resumed_
  std::mutex mutex_;
  _phase     phase_   = _phase::attempt;
  bool       driving_ = false;
  bool       resumed_ = false;

  _retry_async_state(B strategy, F factory, Sch sch, Rcvr r)
      : strategy_(std::move(strategy)),
        factory_(std::move(factory)),
        scheduler_(std::move(sch)),
        receiver_(std::move(r)) {}

  void drive() noexcept {
    std::unique_lock lock(mutex_);
    while (true) {
      auto phase = phase_;
      if (phase == _phase::done) {
        lock.unlock();
        complete();
        return;
      }
      driving_ = true;
      resumed_ = false;
      lock.unlock();

      if (phase == _phase::attempt) {
        launch_attempt();
      } else {
        launch_backoff();
      }

      lock.lock();
      driving_ = false;
      if (!resumed_) {
        return;
      }
    }
  }

  void advance(_phase next) noexcept {
    std::unique_lock lock(mutex_);
    phase_ = next;
    if (driving_) {
      resumed_ = true;
      return;
    }
    lock.unlock();
    drive();
  }

  void on_result(result_type&& result) {
    if (result.has_value()) {
      finish_value(std::move(result));
      return;
    }
    if (execution::stop_requested(receiver_)) {
      finish_stopped();
      return;
    }
    auto step = next_step(strategy_, result.error(), attempt_);
    if (step.is_halt()) {
      finish_value(std::move(result));
    } else if (step.delay() == duration::zero()) {
      advance(_phase::attempt);
    } else {
      delay_ = step.delay();
      advance(_phase::backoff);
    }
  }

  void finish_value(result_type&& result) noexcept {
    outcome_.template emplace<1>(std::move(result));
    advance(_phase::done);
  }

  void finish_error(std::exception_ptr ep) noexcept {
    outcome_.template emplace<2>(std::move(ep));
    advance(_phase::done);
  }

  void finish_stopped() noexcept {
    logger()->debug("again: retry stopped after {} attempt(s)", attempt_);
    outcome_.template emplace<0>();
    advance(_phase::done);
  }

 private:
  void launch_attempt() noexcept {
    if (execution::stop_requested(receiver_)) {
      finish_stopped();
      return;
    }
    ++attempt_;
    try {
      _launch(attempt_op_, std::invoke(factory_), _attempt_receiver<_retry_async_state>{this});
    } catch (...) {
      finish_error(std::current_exception());
    }
  }

  void launch_backoff() noexcept {
    try {
      _launch(backoff_op_, scheduler_.schedule_after(delay_),
              _backoff_receiver<_retry_async_state>{this});
    } catch (...) {
      finish_error(std::current_exception());
    }
  }

  // Last use of `this`: the receiver may destroy the session
  void complete() noexcept {
    if (auto* result = std::get_if<1>(&outcome_)) {
      auto value = std::move(*result);
      std::move(receiver_).set_value(std::move(value));
    } else if (auto* ep = std::get_if<2>(&outcome_)) {
      auto error = std::move(*ep);
      std::move(receiver_).set_error(std::move(error));
    } else {
      std::move(receiver_).set_stopped();
    }
  }
};

template <class B, class F, class Sch, class Rcvr>
struct _retry_async_operation {
  using operation_state_concept = operation_state_t;

  std::unique_ptr<_retry_async_state<B, F, Sch, Rcvr>> state_;

  void start() & noexcept {
    state_->drive();
  }
};

}  // namespace _retry_async_detail

template <class B, class F, class Sch>
struct _retry_async_sender {
  using sender_concept = execution::sender_t;
  using result_type    = execution::single_value_t<std::invoke_result_t<F&>>;
  using value_types    = execution::type_list<result_type>;

  B   strategy_;
  F   factory_;
  Sch scheduler_;

  template <class Env>
  auto get_completion_signatures(Env&& /*unused*/) const {
    return execution::completion_signatures<execution::set_value_t(result_type),
                                            execution::set_error_t(std::exception_ptr),
                                            execution::set_stopped_t()>{};
  }

  template <execution::receiver R>
  auto connect(R&& r) && {
    using state_t = _retry_async_detail::_retry_async_state<B, F, Sch, execution::__decay_t<R>>;
    return _retry_async_detail::_retry_async_operation<B, F, Sch, execution::__decay_t<R>>{
        std::make_unique<state_t>(std::move(strategy_), std::move(factory_),
                                  std::move(scheduler_), std::forward<R>(r))};
  }

  // Every connection starts from a copy of the strategy in its initial state
  template <execution::receiver R>
    requires std::copy_constructible<B> && std::copy_constructible<F>
  auto connect(R&& r) const& {
    using state_t = _retry_async_detail::_retry_async_state<B, F, Sch, execution::__decay_t<R>>;
    return _retry_async_detail::_retry_async_operation<B, F, Sch, execution::__decay_t<R>>{
        std::make_unique<state_t>(strategy_, factory_, scheduler_, std::forward<R>(r))};
  }
};

struct retry_async_t {
  // `factory()` produces the sender of one attempt; its value is a std::expected<T, E>. Delays
  // between attempts are waited on `sch` without blocking a thread.
  template <class B, class F, execution::timed_scheduler Sch>
    requires std::invocable<F&> && execution::typed_sender<std::invoke_result_t<F&>>
             && attempt_result<execution::single_value_t<std::invoke_result_t<F&>>>
             && backoff_strategy<
                 B, typename execution::single_value_t<std::invoke_result_t<F&>>::error_type>
  auto operator()(B strategy, F factory, Sch sch) const -> _retry_async_sender<B, F, Sch> {
    return _retry_async_sender<B, F, Sch>{std::move(strategy), std::move(factory), std::move(sch)};
  }
};

inline constexpr retry_async_t retry_async{};

// Like retry_async(), but errors rejected by `predicate(error, attempt)` end the session at once
struct retry_async_if_t {
  template <class B, class F, class Pred, execution::timed_scheduler Sch>
    requires std::invocable<F&> && execution::typed_sender<std::invoke_result_t<F&>>
  auto operator()(B strategy, F factory, Pred predicate, Sch sch) const {
    return retry_async(retry_when(std::move(strategy), std::move(predicate)), std::move(factory),
                       std::move(sch));
  }
};

inline constexpr retry_async_if_t retry_async_if{};

}  // namespace again
