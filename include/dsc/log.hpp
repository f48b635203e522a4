#ifndef DSC_LOG_HPP
#define DSC_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace dsc {
namespace log {

// Shared "dsc" logger (stderr, colored). Created on first use.
std::shared_ptr<spdlog::logger> logger();

// "trace", "debug", "info", "warn", "error", "critical", "off".
// Returns false for an unknown level name.
bool set_level(const std::string& level);

} // namespace log
} // namespace dsc

#endif // DSC_LOG_HPP
