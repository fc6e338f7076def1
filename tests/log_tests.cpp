#include <again/again.hpp>
#include <boost/ut.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <stop_token>
#include <vector>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

using namespace boost::ut;
using namespace std::chrono_literals;

namespace {

struct captured_logger {
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink =
      std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
  std::shared_ptr<spdlog::logger> logger = std::make_shared<spdlog::logger>("again-test", sink);

  captured_logger() {
    logger->set_level(spdlog::level::debug);
  }

  auto levels() -> std::vector<spdlog::level::level_enum> {
    std::vector<spdlog::level::level_enum> out;
    for (const auto& msg : sink->last_raw()) {
      out.push_back(msg.level);
    }
    return out;
  }
};

}  // namespace

int main() {
  "set_logger_replaces_default"_test = [] {
    captured_logger captured;
    again::set_logger(captured.logger);
    expect(again::logger() == captured.logger);

    again::set_logger(nullptr);
    expect(again::logger() == spdlog::default_logger());
  };

  "first_attempt_success_logs_nothing"_test = [] {
    captured_logger captured;
    again::set_logger(captured.logger);

    auto result =
        again::retry(again::immediate{}, [] -> std::expected<int, int> { return 1; });
    expect(result.has_value());
    expect(captured.levels().empty());

    again::set_logger(nullptr);
  };

  "retries_log_debug_and_halt_logs_info"_test = [] {
    captured_logger captured;
    again::set_logger(captured.logger);

    auto result = again::retry(again::with_max_attempts(again::constant(1ms), 3),
                               [] -> std::expected<int, int> { return std::unexpected(2); });
    expect(!result.has_value());

    using spdlog::level::debug;
    using spdlog::level::info;
    expect(captured.levels() == std::vector<spdlog::level::level_enum>{debug, debug, info});

    again::set_logger(nullptr);
  };

  "async_stop_logs_debug"_test = [] {
    captured_logger captured;
    again::set_logger(captured.logger);

    again::execution::timer_loop loop;
    std::stop_source             stop;
    stop.request_stop();

    auto sndr = again::retry_async(
        again::immediate{},
        [] { return again::execution::just(std::expected<int, int>(1)); },
        loop.get_scheduler());
    auto result = again::this_thread::sync_wait(std::move(sndr), stop.get_token());
    expect(!result.has_value());
    expect(captured.levels() == std::vector<spdlog::level::level_enum>{spdlog::level::debug});

    again::set_logger(nullptr);
  };

  // Runs last: it leaves spdlog without a default logger
  "failed_attempts_survive_dropped_default_logger"_test = [] {
    again::set_logger(nullptr);
    spdlog::drop_all();
    expect(again::logger() != nullptr);

    auto result = again::retry(again::with_max_attempts(again::immediate{}, 2),
                               [] -> std::expected<int, int> { return std::unexpected(1); });
    expect(!result.has_value());
    expect(result.error() == 1_i);
  };

  return 0;
}
