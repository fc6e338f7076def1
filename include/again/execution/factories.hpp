#pragma once

#include <tuple>
#include <utility>

#include "concepts.hpp"

namespace again::execution {

// ============================================================================
// just(vs...) - completes inline with the given values
// ============================================================================

template <class... Vs>
struct _just_sender {
  using sender_concept = sender_t;
  using value_types    = type_list<Vs...>;

  std::tuple<Vs...> values_;

  template <class Env>
  auto get_completion_signatures(Env&& /*unused*/) const noexcept {
    return completion_signatures<set_value_t(Vs...)>{};
  }

  template <receiver R>
  auto connect(R&& r) && {
    return _operation<__decay_t<R>>{std::move(values_), std::forward<R>(r)};
  }

  template <receiver R>
  auto connect(R&& r) const& {
    return _operation<__decay_t<R>>{values_, std::forward<R>(r)};
  }

 private:
  template <class Rcvr>
  struct _operation {
    using operation_state_concept = operation_state_t;

    std::tuple<Vs...> values_;
    Rcvr              receiver_;

    void start() & noexcept {
      std::apply(
          [this](Vs&... vs) -> void { std::move(receiver_).set_value(std::move(vs)...); },
          values_);
    }
  };
};

struct just_t {
  template <class... Vs>
  constexpr auto operator()(Vs&&... vs) const {
    return _just_sender<__decay_t<Vs>...>{std::tuple<__decay_t<Vs>...>{std::forward<Vs>(vs)...}};
  }
};

inline constexpr just_t just{};

}  // namespace again::execution
