#pragma once

#include <concepts>
#include <stop_token>
#include <utility>

#include "concepts.hpp"

namespace again::execution {

// Query tag for the stop token of an environment. Environments without one yield a
// default-constructed std::stop_token, which can never be stopped.
struct get_stop_token_t {
  template <class Env>
  auto operator()(const Env& env) const noexcept -> decltype(auto) {
    if constexpr (requires { query(env, get_stop_token_t{}); }) {
      return query(env, get_stop_token_t{});
    } else {
      return std::stop_token{};
    }
  }
};

inline constexpr get_stop_token_t get_stop_token{};

template <class Env>
using stop_token_of_t = __decay_t<decltype(get_stop_token(std::declval<const Env&>()))>;

template <class Token, class Callback>
struct _stop_callback_for;

template <class Callback>
struct _stop_callback_for<std::stop_token, Callback> {
  using type = std::stop_callback<Callback>;
};

template <class Token, class Callback>
using stop_callback_for_t = typename _stop_callback_for<Token, Callback>::type;

// True once the environment of `rcvr` carries a stop request
template <class Rcvr>
[[nodiscard]] bool stop_requested(const Rcvr& rcvr) noexcept {
  return get_stop_token(get_env(rcvr)).stop_requested();
}

}  // namespace again::execution
