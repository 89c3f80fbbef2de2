#pragma once
#include <memory>

#include <spdlog/spdlog.h>

namespace termcalc {

/// The "termcalc" logger (stderr, level warn until changed).
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace termcalc
