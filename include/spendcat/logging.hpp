#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace spendcat {

inline constexpr const char* kLoggerName = "spendcat";

// Shared engine logger, created on first use with a stderr sink.
std::shared_ptr<spdlog::logger> GetLogger();

// Accepts trace, debug, info, warn, error, critical, off. Throws
// std::invalid_argument for anything else.
void SetLogLevel(const std::string& level);

}  // namespace spendcat
