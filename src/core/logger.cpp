#include "dentassist/core/logger.hpp"

#include <array>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace dentassist {

namespace {

std::shared_ptr<spdlog::logger> g_logger;

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 8> kLevels{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

} // anonymous namespace

auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum> {
    for (const auto& [key, level] : kLevels) {
        if (key == name) return level;
    }
    return std::nullopt;
}

void Logger::init(std::string_view name, std::string_view level) {
    // Re-initialising under the same name would otherwise throw from the registry.
    spdlog::drop(std::string(name));
    g_logger = spdlog::stdout_color_mt(std::string(name));
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    auto& logger = get();
    if (auto parsed = parse_log_level(level)) {
        logger->set_level(*parsed);
        return;
    }
    logger->set_level(spdlog::level::info);
    logger->warn("Unknown log level '{}', using info", level);
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace dentassist
