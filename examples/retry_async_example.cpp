#include <again/again.hpp>
#include <chrono>
#include <expected>
#include <iostream>
#include <stop_token>
#include <thread>

using namespace again::execution;
using namespace std::chrono_literals;

auto main() -> int {
  // Backoff waits run on this loop; no thread sleeps between attempts
  timer_loop   loop;
  std::jthread worker([&] { loop.run(); });
  auto         sch = loop.get_scheduler();

  std::cout << "=== Retry until the service recovers ===" << '\n';
  int  attempts = 0;
  auto work     = again::retry_async(
      again::with_max_attempts(again::constant(20ms), 5),
      [&] {
        return schedule(sch) | then([&] -> std::expected<int, int> {
                 ++attempts;
                 std::cout << "Attempt " << attempts << " on thread " << std::this_thread::get_id()
                           << '\n';
                 if (attempts < 3) {
                   return std::unexpected(503);
                 }
                 return 200;
               });
      },
      sch);

  auto result = again::this_thread::sync_wait(std::move(work));
  if (result && std::get<0>(*result)) {
    std::cout << "Status: " << *std::get<0>(*result) << '\n';
  }

  std::cout << "\n=== Cancel a session that never succeeds ===" << '\n';
  std::stop_source stop;
  std::jthread     deadline([&] {
    std::this_thread::sleep_for(100ms);
    stop.request_stop();
  });

  auto endless = again::retry_async(
      again::constant(10ms), [] { return just(std::expected<int, int>(std::unexpected(503))); },
      sch);
  auto cancelled = again::this_thread::sync_wait(std::move(endless), stop.get_token());
  if (!cancelled) {
    std::cout << "Stopped by deadline" << '\n';
  }

  loop.finish();
  return 0;
}
