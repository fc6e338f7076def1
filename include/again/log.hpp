#pragma once

#include <memory>
#include <mutex>
#include <utility>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

namespace again {

namespace _log_detail {

struct _registry {
  std::mutex                      mutex;
  std::shared_ptr<spdlog::logger> logger;
};

inline auto _instance() -> _registry& {
  static _registry registry;
  return registry;
}

// Used once spdlog has no default logger, e.g. after spdlog::drop_all() or spdlog::shutdown()
inline auto _silent() -> std::shared_ptr<spdlog::logger> {
  static auto silent =
      std::make_shared<spdlog::logger>("again", std::make_shared<spdlog::sinks::null_sink_mt>());
  return silent;
}

}  // namespace _log_detail

// Logger used by the retry engines. Falls back to spdlog's default logger until one is set, and
// to a discarding logger when spdlog has none. Never null.
inline auto logger() -> std::shared_ptr<spdlog::logger> {
  {
    auto&            registry = _log_detail::_instance();
    std::scoped_lock lock(registry.mutex);
    if (registry.logger) {
      return registry.logger;
    }
  }
  if (auto fallback = spdlog::default_logger()) {
    return fallback;
  }
  return _log_detail::_silent();
}

// Passing nullptr restores the default logger
inline void set_logger(std::shared_ptr<spdlog::logger> logger) {
  auto&            registry = _log_detail::_instance();
  std::scoped_lock lock(registry.mutex);
  registry.logger = std::move(logger);
}

}  // namespace again
