#pragma once

#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <stop_token>
#include <tuple>
#include <type_traits>
#include <variant>

#include "concepts.hpp"
#include "stop_token.hpp"

namespace again::this_thread {

namespace _sync_wait_detail {

template <class... Ts>
struct _sync_wait_state {
  std::mutex                                                          mutex;
  std::condition_variable                                             cv;
  bool                                                                completed = false;
  std::variant<std::monostate, std::tuple<Ts...>, std::exception_ptr> result;
};

struct _sync_wait_env {
  std::stop_token stop_token;

  template <class Query>
    requires std::same_as<Query, execution::get_stop_token_t>
  friend auto query(const _sync_wait_env& self, Query /*unused*/) noexcept -> std::stop_token {
    return self.stop_token;
  }
};

template <class... Ts>
struct _sync_wait_receiver {
  using receiver_concept = execution::receiver_t;

  _sync_wait_state<Ts...>* state_;
  std::stop_token          stop_token_;

  template <class... Args>
    requires std::constructible_from<std::tuple<Ts...>, Args...>
  void set_value(Args&&... args) && noexcept {
    std::scoped_lock lock(state_->mutex);
    try {
      state_->result.template emplace<1>(std::forward<Args>(args)...);
    } catch (...) {
      state_->result.template emplace<2>(std::current_exception());
    }
    state_->completed = true;
    state_->cv.notify_one();
  }

  void set_error(std::exception_ptr ep) && noexcept {
    std::scoped_lock lock(state_->mutex);
    state_->result.template emplace<2>(std::move(ep));
    state_->completed = true;
    state_->cv.notify_one();
  }

  template <class E>
  void set_error(E&& e) && noexcept {
    std::move(*this).set_error(std::make_exception_ptr(std::forward<E>(e)));
  }

  void set_stopped() && noexcept {
    std::scoped_lock lock(state_->mutex);
    state_->result.template emplace<0>();
    state_->completed = true;
    state_->cv.notify_one();
  }

  auto get_env() const noexcept -> _sync_wait_env {
    return _sync_wait_env{stop_token_};
  }
};

template <class List>
struct _wait_for;

template <class... Ts>
struct _wait_for<execution::type_list<Ts...>> {
  template <execution::sender S>
  auto operator()(S&& sndr, std::stop_token token) const -> std::optional<std::tuple<Ts...>> {
    _sync_wait_state<Ts...> state;

    auto op = execution::connect(std::forward<S>(sndr),
                                 _sync_wait_receiver<Ts...>{&state, std::move(token)});
    op.start();

    {
      std::unique_lock lock(state.mutex);
      state.cv.wait(lock, [&] -> bool { return state.completed; });
    }

    if (auto* ep = std::get_if<2>(&state.result)) {
      std::rethrow_exception(*ep);
    }
    if (auto* values = std::get_if<1>(&state.result)) {
      return std::move(*values);
    }
    return std::nullopt;
  }
};

}  // namespace _sync_wait_detail

// Blocks the calling thread until the sender completes. Returns the values of a value
// completion, std::nullopt when stopped, and rethrows an error completion.
struct sync_wait_t {
  template <execution::typed_sender S>
  auto operator()(S&& sndr) const {
    return (*this)(std::forward<S>(sndr), std::stop_token{});
  }

  // The token is exposed to the sender through the receiver's environment
  template <execution::typed_sender S>
  auto operator()(S&& sndr, std::stop_token token) const {
    using values = typename execution::__remove_cvref_t<S>::value_types;
    return _sync_wait_detail::_wait_for<values>{}(std::forward<S>(sndr), std::move(token));
  }
};

inline constexpr sync_wait_t sync_wait{};

}  // namespace again::this_thread
