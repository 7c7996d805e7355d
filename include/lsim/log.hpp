#pragma once
#include <memory>

#include <spdlog/spdlog.h>

namespace lsim {

// Kernel logger ("lsim"). Created on first use, shares the default sinks.
std::shared_ptr<spdlog::logger> logger();

// Pattern + level for executables; tests leave the defaults alone.
void configure_logging(spdlog::level::level_enum level);

} // namespace lsim
