#ifndef TICKVAULT_LOG_HPP
#define TICKVAULT_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tickvault {

namespace log {

// Shared "tickvault" logger (stderr, colored). Created on first use.
std::shared_ptr<spdlog::logger> logger();

// "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off"
void set_level(std::string_view level);

} // namespace log

} // namespace tickvault

#endif // TICKVAULT_LOG_HPP
