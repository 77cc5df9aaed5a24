#include "spendcat/logging.hpp"

#include <mutex>
#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace spendcat {

std::shared_ptr<spdlog::logger> GetLogger() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (!spdlog::get(kLoggerName)) {
      auto logger = spdlog::stderr_color_mt(kLoggerName);
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      logger->set_level(spdlog::level::info);
    }
  });
  return spdlog::get(kLoggerName);
}

void SetLogLevel(const std::string& level) {
  const auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off; only accept an explicit "off".
  if (parsed == spdlog::level::off && level != "off") {
    throw std::invalid_argument("unknown log level: " + level);
  }
  GetLogger()->set_level(parsed);
}

}  // namespace spendcat
