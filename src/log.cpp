#include "termcalc/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace termcalc {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> log = [] {
        auto l = spdlog::stderr_color_mt("termcalc");
        l->set_level(spdlog::level::warn);
        l->set_pattern("[%l] %v");
        return l;
    }();
    return log;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace termcalc
