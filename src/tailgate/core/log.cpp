// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tailgate/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <new>
#include <string>

namespace tailgate::log {

std::shared_ptr<spdlog::logger> logger() noexcept {
    static std::once_flag init_flag;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(init_flag, [] {
        try {
            instance = spdlog::get(std::string(LOGGER_NAME));
            if (!instance) {
                instance = spdlog::stderr_color_mt(std::string(LOGGER_NAME));
                instance->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
                instance->set_level(spdlog::level::warn);
            }
        } catch (const spdlog::spdlog_ex&) {
            // Registry refused the name or the sink; fall back to a sink-less logger
            instance = std::make_shared<spdlog::logger>(std::string(LOGGER_NAME));
        }
    });

    return instance;
}

void set_level(spdlog::level::level_enum level) noexcept {
    logger()->set_level(level);
}

bool set_level(std::string_view name) noexcept {
    try {
        const std::string level_name(name);
        auto level = spdlog::level::from_str(level_name);

        // from_str maps unknown names to off; only accept off when asked for it
        if (level == spdlog::level::off && level_name != "off") {
            return false;
        }

        set_level(level);
        return true;
    } catch (const std::bad_alloc&) {
        return false;
    }
}

} // namespace tailgate::log
