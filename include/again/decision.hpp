#pragma once

#include <algorithm>
#include <chrono>
#include <optional>

namespace again {

using duration = std::chrono::steady_clock::duration;

// What a backoff strategy wants after a failed attempt: wait and try again, or give up.
class decision {
 public:
  template <class Rep, class Period>
  [[nodiscard]] static constexpr auto retry_after(std::chrono::duration<Rep, Period> delay) noexcept
      -> decision {
    return decision{std::max(std::chrono::duration_cast<duration>(delay), duration::zero())};
  }

  [[nodiscard]] static constexpr auto halt() noexcept -> decision {
    return decision{};
  }

  [[nodiscard]] constexpr auto is_halt() const noexcept -> bool {
    return !delay_.has_value();
  }

  [[nodiscard]] constexpr auto is_retry() const noexcept -> bool {
    return delay_.has_value();
  }

  // Only meaningful for retry decisions; zero for halt
  [[nodiscard]] constexpr auto delay() const noexcept -> duration {
    return delay_.value_or(duration::zero());
  }

  auto operator==(const decision&) const -> bool = default;

 private:
  constexpr decision() noexcept = default;

  constexpr explicit decision(duration delay) noexcept : delay_(delay) {}

  std::optional<duration> delay_;
};

}  // namespace again
