// =============================================================================
// log.cpp - Engine logger
// =============================================================================

#include "tickvault/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace tickvault {

namespace log {

namespace {

constexpr const char* LOGGER_NAME = "tickvault";

std::once_flag init_flag;
std::shared_ptr<spdlog::logger> instance;

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(init_flag, [] {
        instance = spdlog::get(LOGGER_NAME);
        if (!instance) {
            instance = spdlog::stderr_color_mt(LOGGER_NAME);
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            instance->set_level(spdlog::level::info);
        }
    });
    return instance;
}

void set_level(std::string_view level) {
    logger()->set_level(spdlog::level::from_str(std::string(level)));
}

} // namespace log

} // namespace tickvault
