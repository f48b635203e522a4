// =============================================================================
// log.cpp - Engine Logger
// =============================================================================

#include "dsc/log.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dsc {
namespace log {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(once, [] {
        instance = spdlog::get("dsc");
        if (!instance) {
            instance = spdlog::stderr_color_mt("dsc");
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            instance->set_level(spdlog::level::warn);
        }
    });
    return instance;
}

bool set_level(const std::string& level) {
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace log
} // namespace dsc
