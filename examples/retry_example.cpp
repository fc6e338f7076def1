#include <again/again.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

using namespace std::chrono_literals;

enum class fetch_error { timeout, not_found };

// Pretends to talk to a flaky service that answers on the third call
auto fetch_config(int& calls) -> std::expected<std::string, fetch_error> {
  ++calls;
  std::cout << "Attempt " << calls << '\n';
  if (calls < 3) {
    return std::unexpected(fetch_error::timeout);
  }
  return "max_connections=64";
}

auto main() -> int {
  spdlog::set_level(spdlog::level::debug);

  std::cout << "=== Exponential backoff ===" << '\n';
  int  calls  = 0;
  auto result = again::retry(again::exponential(again::exponential_config{
                                 .initial_delay = 50ms,
                                 .max_delay     = 400ms,
                                 .multiplier    = 2.0,
                                 .max_retries   = 5,
                             }),
                             [&] { return fetch_config(calls); });
  if (result) {
    std::cout << "Config: " << *result << '\n';
  }

  std::cout << "\n=== Give up on permanent errors ===" << '\n';
  int  lookups = 0;
  auto missing = again::retry_if(
      again::constant(10ms),
      [&] -> std::expected<std::string, fetch_error> {
        ++lookups;
        return std::unexpected(lookups == 1 ? fetch_error::timeout : fetch_error::not_found);
      },
      [](fetch_error e, std::size_t /*attempt*/) { return e == fetch_error::timeout; });
  if (!missing) {
    std::cout << "Gave up after " << lookups << " attempts" << '\n';
  }

  return 0;
}
