#include "cmdq/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cmdq::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get(kLoggerName);
        if (!instance) {
            instance = spdlog::stderr_color_mt(kLoggerName);
            instance->set_level(spdlog::level::info);
        }
    });
    return instance;
}

bool setLevel(std::string_view level) {
    const std::string name(level);
    const auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only accept off when asked for it.
    if (parsed == spdlog::level::off && name != "off") return false;
    logger()->set_level(parsed);
    return true;
}

} // namespace cmdq::log
