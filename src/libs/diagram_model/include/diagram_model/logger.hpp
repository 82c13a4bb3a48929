#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace diagram_model {

// Named stderr logger shared by every library that logs under `name`.
inline std::shared_ptr<spdlog::logger> component_logger(const std::string& name) {
    if (auto existing = spdlog::get(name)) return existing;
    try {
        auto logger = spdlog::stderr_color_mt(name);
        logger->set_level(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        return spdlog::default_logger();
    }
}

} // namespace diagram_model
