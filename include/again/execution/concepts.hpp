#pragma once

#include <chrono>
#include <concepts>
#include <type_traits>
#include <utility>

namespace again::execution {

template <class T>
using __decay_t = std::decay_t<T>;

template <class T>
using __remove_cvref_t = std::remove_cvref_t<T>;

// Compile-time list of the values a sender completes with
template <class... Ts>
struct type_list {};

// ============================================================================
// Environments
// ============================================================================

struct empty_env {};

struct get_env_t {
  template <class T>
    requires requires(const T& t) { t.get_env(); }
  constexpr auto operator()(const T& t) const noexcept(noexcept(t.get_env()))
      -> decltype(t.get_env()) {
    return t.get_env();
  }

  template <class T>
  constexpr auto operator()(const T& /*unused*/) const noexcept -> empty_env
    requires(!requires(const T& t) { t.get_env(); })
  {
    return {};
  }
};

inline constexpr get_env_t get_env{};

template <class T>
using env_of_t = decltype(get_env(std::declval<const T&>()));

// ============================================================================
// Receivers
// ============================================================================

struct receiver_t {};
struct set_value_t {};
struct set_error_t {};
struct set_stopped_t {};

template <class Rcvr>
concept receiver =
    std::move_constructible<__remove_cvref_t<Rcvr>>
    && std::constructible_from<__remove_cvref_t<Rcvr>, Rcvr> && requires {
         typename __remove_cvref_t<Rcvr>::receiver_concept;
         requires std::same_as<typename __remove_cvref_t<Rcvr>::receiver_concept, receiver_t>;
       } && requires(__remove_cvref_t<Rcvr>&& r) {
         { std::move(r).set_stopped() } noexcept;
       };

// ============================================================================
// Operation states
// ============================================================================

struct operation_state_t {};

template <class O>
concept operation_state = std::destructible<O> && std::is_object_v<O> && requires {
  typename O::operation_state_concept;
  requires std::same_as<typename O::operation_state_concept, operation_state_t>;
} && requires(O& o) {
  { o.start() } noexcept;
};

// ============================================================================
// Senders
// ============================================================================

template <class... Sigs>
struct completion_signatures {};

struct sender_t {};

template <class Sndr>
concept sender = std::move_constructible<__remove_cvref_t<Sndr>> && requires {
  typename __remove_cvref_t<Sndr>::sender_concept;
  requires std::same_as<typename __remove_cvref_t<Sndr>::sender_concept, sender_t>;
};

template <class Sndr, class Rcvr>
concept sender_to = sender<Sndr> && receiver<Rcvr> && requires(Sndr&& sndr, Rcvr&& rcvr) {
  { std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr)) } -> operation_state;
};

// A sender that advertises its value completion through value_types
template <class Sndr>
concept typed_sender = sender<Sndr> && requires {
  typename __remove_cvref_t<Sndr>::value_types;
};

struct connect_t {
  template <class Sndr, class Rcvr>
    requires sender_to<Sndr, Rcvr>
  constexpr auto operator()(Sndr&& sndr, Rcvr&& rcvr) const
      noexcept(noexcept(std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr))))
          -> decltype(std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr))) {
    return std::forward<Sndr>(sndr).connect(std::forward<Rcvr>(rcvr));
  }
};

inline constexpr connect_t connect{};

namespace _value_types_detail {

template <class List>
struct _single;

template <class T>
struct _single<type_list<T>> {
  using type = T;
};

}  // namespace _value_types_detail

// The only value type of a sender declaring value_types = type_list<T>
template <class Sndr>
using single_value_t =
    typename _value_types_detail::_single<typename __remove_cvref_t<Sndr>::value_types>::type;

// ============================================================================
// Schedulers
// ============================================================================

struct scheduler_t {};

template <class Sch>
concept scheduler =
    std::copy_constructible<__remove_cvref_t<Sch>>
    && std::equality_comparable<__remove_cvref_t<Sch>> && requires {
         typename __remove_cvref_t<Sch>::scheduler_concept;
         requires std::same_as<typename __remove_cvref_t<Sch>::scheduler_concept, scheduler_t>;
       } && requires(Sch&& sch) {
         { std::forward<Sch>(sch).schedule() } -> sender;
       };

// A scheduler that can also complete after a relative delay
template <class Sch>
concept timed_scheduler =
    scheduler<Sch> && requires(Sch&& sch, std::chrono::steady_clock::duration d) {
      { std::forward<Sch>(sch).schedule_after(d) } -> sender;
    };

struct schedule_t {
  template <scheduler Sch>
  constexpr auto operator()(Sch&& sch) const noexcept(noexcept(std::forward<Sch>(sch).schedule()))
      -> decltype(std::forward<Sch>(sch).schedule()) {
    return std::forward<Sch>(sch).schedule();
  }
};

inline constexpr schedule_t schedule{};

struct schedule_after_t {
  template <timed_scheduler Sch, class Rep, class Period>
  constexpr auto operator()(Sch&& sch, std::chrono::duration<Rep, Period> d) const {
    return std::forward<Sch>(sch).schedule_after(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(d));
  }
};

inline constexpr schedule_after_t schedule_after{};

}  // namespace again::execution
