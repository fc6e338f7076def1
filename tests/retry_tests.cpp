#include <again/again.hpp>
#include <boost/ut.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace boost::ut;
using namespace std::chrono_literals;

// ============================================================================
// Test Helpers
// ============================================================================

namespace {

// Counts consultations and forwards them to a wrapped strategy
template <class B>
struct counting_backoff {
  B            inner;
  std::size_t* calls;

  template <class E>
  auto next(const E& error) -> again::decision {
    ++*calls;
    return inner.next(error);
  }
};

// Records requested delays instead of sleeping
struct recording_sleeper {
  std::vector<again::duration>* delays;

  void operator()(again::duration d) const {
    delays->push_back(d);
  }
};

struct deadline_exceeded : std::runtime_error {
  deadline_exceeded() : std::runtime_error("deadline exceeded") {}
};

}  // namespace

int main() {
  // ==========================================================================
  // Success and halt
  // ==========================================================================

  "success_short_circuits"_test = [] {
    std::size_t consultations = 0;
    int         invocations   = 0;

    auto result = again::retry(counting_backoff<again::immediate>{{}, &consultations},
                               [&] -> std::expected<std::string, int> {
                                 ++invocations;
                                 return "ok";
                               });

    expect(result.has_value());
    expect(*result == std::string("ok"));
    expect(invocations == 1_i);
    expect(eq(consultations, std::size_t{0}));
  };

  "halt_surfaces_last_error"_test = [] {
    int  invocations = 0;
    auto result      = again::retry(again::with_max_attempts(again::immediate{}, 4),
                                    [&] -> std::expected<int, int> {
                                 ++invocations;
                                 return std::unexpected(invocations * 10);
                               });

    expect(!result.has_value());
    expect(result.error() == 40_i);
    expect(invocations == 4_i);
  };

  "immediate_halt_returns_first_error"_test = [] {
    int  invocations = 0;
    auto result      = again::retry(again::with_max_attempts(again::constant(1s), 1),
                                    [&] -> std::expected<int, std::string> {
                                 ++invocations;
                                 return std::unexpected(std::string("refused"));
                               });

    expect(!result.has_value());
    expect(result.error() == std::string("refused"));
    expect(invocations == 1_i);
  };

  // ==========================================================================
  // Delays
  // ==========================================================================

  "constant_delay_lower_bound"_test = [] {
    using clock = std::chrono::steady_clock;
    std::vector<clock::time_point> starts;

    auto result = again::retry(again::with_max_attempts(again::constant(20ms), 4),
                               [&] -> std::expected<void, int> {
                                 starts.push_back(clock::now());
                                 return std::unexpected(1);
                               });

    expect(!result.has_value());
    expect(eq(starts.size(), std::size_t{4}));
    for (std::size_t i = 1; i < starts.size(); ++i) {
      expect(starts[i] - starts[i - 1] >= clock::duration(20ms));
    }
  };

  "sleeper_receives_strategy_delays"_test = [] {
    std::vector<again::duration> delays;
    int                          invocations = 0;

    auto result = again::retry(
        again::exponential(again::exponential_config{
            .initial_delay = 10ms, .max_delay = 30ms, .multiplier = 2.0, .max_retries = 4}),
        [&] -> std::expected<int, int> {
          ++invocations;
          return std::unexpected(invocations);
        },
        recording_sleeper{&delays});

    expect(!result.has_value());
    expect(result.error() == 5_i);
    expect(delays == std::vector<again::duration>{10ms, 20ms, 30ms, 30ms});
  };

  "zero_delay_does_not_sleep"_test = [] {
    std::vector<again::duration> delays;
    auto                         result = again::retry(
        again::with_max_attempts(again::immediate{}, 3),
        [] -> std::expected<int, int> { return std::unexpected(0); }, recording_sleeper{&delays});

    expect(!result.has_value());
    expect(delays.empty());
  };

  // ==========================================================================
  // Scenarios
  // ==========================================================================

  "immediate_retries_until_fifth_call"_test = [] {
    int                          invocations = 0;
    std::vector<int>             errors;
    std::vector<again::duration> delays;

    auto result = again::retry(
        again::retry_when(again::immediate{},
                          [&](const int& e, std::size_t /*unused*/) {
                            errors.push_back(e);
                            return true;
                          }),
        [&] -> std::expected<void, int> {
          ++invocations;
          if (invocations < 5) {
            return std::unexpected(invocations);
          }
          return {};
        },
        recording_sleeper{&delays});

    expect(result.has_value());
    expect(invocations == 5_i);
    expect(errors == std::vector<int>{1, 2, 3, 4});
    expect(delays.empty());
  };

  "constant_halting_on_third_consultation"_test = [] {
    int  invocations = 0;
    auto result      = again::retry(again::with_max_attempts(again::constant(1ms), 3),
                                    [&] -> std::expected<void, int> {
                                 ++invocations;
                                 return std::unexpected(0);
                               });

    expect(!result.has_value());
    expect(result.error() == 0_i);
    expect(invocations == 3_i);
  };

  "never_halting_strategy_needs_external_deadline"_test = [] {
    using clock   = std::chrono::steady_clock;
    auto deadline = clock::now() + 50ms;
    int  invocations = 0;

    // The sleeper stands in for the caller's own timeout mechanism
    auto bounded_sleep = [deadline](again::duration d) {
      if (clock::now() >= deadline) {
        throw deadline_exceeded();
      }
      std::this_thread::sleep_for(d);
    };

    expect(throws<deadline_exceeded>([&] {
      [[maybe_unused]] auto result = again::retry(
          again::constant(1ms),
          [&] -> std::expected<void, int> {
            ++invocations;
            return std::unexpected(0);
          },
          bounded_sleep);
    }));
    expect(invocations > 1_i);
  };

  // ==========================================================================
  // retry_if
  // ==========================================================================

  "retry_if_stops_on_rejected_error"_test = [] {
    int                      invocations = 0;
    std::vector<std::size_t> attempts;

    auto result = again::retry_if(
        again::immediate{},
        [&] -> std::expected<int, std::string> {
          ++invocations;
          return std::unexpected(invocations < 3 ? std::string("transient")
                                                 : std::string("fatal"));
        },
        [&](const std::string& e, std::size_t attempt) {
          attempts.push_back(attempt);
          return e == "transient";
        });

    expect(!result.has_value());
    expect(result.error() == std::string("fatal"));
    expect(invocations == 3_i);
    expect(attempts == std::vector<std::size_t>{1, 2, 3});
  };

  "retry_if_succeeds_after_transient_errors"_test = [] {
    int  invocations = 0;
    auto result      = again::retry_if(
        again::constant(1ms),
        [&] -> std::expected<int, int> {
          if (++invocations < 3) {
            return std::unexpected(503);
          }
          return 200;
        },
        [](int code, std::size_t attempt) { return code >= 500 && attempt < 10; });

    expect(result.has_value());
    expect(*result == 200_i);
    expect(invocations == 3_i);
  };

  // ==========================================================================
  // Out-of-band failures
  // ==========================================================================

  "operation_exception_propagates"_test = [] {
    int invocations = 0;
    expect(throws<std::logic_error>([&] {
      [[maybe_unused]] auto result =
          again::retry(again::immediate{}, [&] -> std::expected<int, int> {
            if (++invocations == 2) {
              throw std::logic_error("broken");
            }
            return std::unexpected(0);
          });
    }));
    expect(invocations == 2_i);
  };

  "runtime_selected_strategy"_test = [] {
    again::any_backoff<int> strategy = again::with_max_attempts(again::constant(1ms), 2);
    int                     invocations = 0;

    auto result = again::retry(std::move(strategy), [&] -> std::expected<int, int> {
      ++invocations;
      return std::unexpected(invocations);
    });

    expect(!result.has_value());
    expect(result.error() == 2_i);
    expect(invocations == 2_i);
  };

  return 0;
}
