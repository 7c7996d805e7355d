#include "lsim/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lsim {

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> log;
  std::call_once(once, [] {
    log = spdlog::get("lsim");
    if (!log) log = spdlog::stderr_color_mt("lsim");
  });
  return log;
}

void configure_logging(spdlog::level::level_enum level) {
  auto log = logger();
  log->set_level(level);
  log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  log->flush_on(spdlog::level::warn);
}

} // namespace lsim
