#pragma once

#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include "concepts.hpp"

namespace again::execution {

namespace _then_detail {

template <class List, class F>
struct _invoke_result;

template <class... Ts, class F>
struct _invoke_result<type_list<Ts...>, F> {
  using type = std::invoke_result_t<F, Ts...>;
};

template <class T>
struct _wrap {
  using type = type_list<T>;
};

template <>
struct _wrap<void> {
  using type = type_list<>;
};

}  // namespace _then_detail

// ============================================================================
// then(f) - transforms the value completion of a sender
// ============================================================================

template <sender S, class F>
struct _then_sender {
  using sender_concept = sender_t;
  using result_type    = typename _then_detail::_invoke_result<typename S::value_types, F>::type;
  using value_types    = typename _then_detail::_wrap<result_type>::type;

  S sender_;
  F fun_;

  template <class Env>
  auto get_completion_signatures(Env&& /*unused*/) const {
    if constexpr (std::is_void_v<result_type>) {
      return completion_signatures<set_value_t(), set_error_t(std::exception_ptr),
                                   set_stopped_t()>{};
    } else {
      return completion_signatures<set_value_t(result_type), set_error_t(std::exception_ptr),
                                   set_stopped_t()>{};
    }
  }

  template <receiver R>
  auto connect(R&& r) && {
    return std::move(sender_).connect(
        _then_receiver<F, __decay_t<R>>{std::move(fun_), std::forward<R>(r)});
  }

  template <receiver R>
  auto connect(R&& r) const& {
    return sender_.connect(_then_receiver<F, __decay_t<R>>{fun_, std::forward<R>(r)});
  }

 private:
  template <class Fn, class Rcvr>
  struct _then_receiver {
    using receiver_concept = receiver_t;

    Fn   fun_;
    Rcvr receiver_;

    template <class... Args>
    void set_value(Args&&... args) && noexcept {
      try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn, Args...>>) {
          std::invoke(std::move(fun_), std::forward<Args>(args)...);
          std::move(receiver_).set_value();
        } else {
          std::move(receiver_).set_value(std::invoke(std::move(fun_), std::forward<Args>(args)...));
        }
      } catch (...) {
        std::move(receiver_).set_error(std::current_exception());
      }
    }

    template <class E>
    void set_error(E&& e) && noexcept {
      std::move(receiver_).set_error(std::forward<E>(e));
    }

    void set_stopped() && noexcept {
      std::move(receiver_).set_stopped();
    }

    // Stop requests of the consumer reach the upstream operation
    auto get_env() const noexcept -> env_of_t<Rcvr> {
      return execution::get_env(receiver_);
    }
  };
};

template <class F>
struct _pipeable_then {
  F fun_;

  template <sender S>
  friend auto operator|(S&& s, _pipeable_then p) {
    return _then_sender<__decay_t<S>, F>{std::forward<S>(s), std::move(p.fun_)};
  }
};

struct then_t {
  template <sender S, class F>
  constexpr auto operator()(S&& s, F&& f) const {
    return _then_sender<__decay_t<S>, __decay_t<F>>{std::forward<S>(s), std::forward<F>(f)};
  }

  template <class F>
  constexpr auto operator()(F&& f) const {
    return _pipeable_then<__decay_t<F>>{std::forward<F>(f)};
  }
};

inline constexpr then_t then{};

}  // namespace again::execution
