#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace dentassist {

inline constexpr std::string_view kLoggerName = "dentassist";

/// Maps a configured level name ("trace" ... "critical", "off"; "warning"
/// is accepted for "warn") onto spdlog's enum. Unknown names yield nullopt.
auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum>;

/// Process-wide spdlog logger writing to colour stdout. `get()` creates it
/// at info level on first use, so code that logs before the CLI has read
/// its configuration (and every test) still has a sink.
class Logger {
public:
    static void init(std::string_view name = kLoggerName, std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// An unknown level leaves the logger at info and says so.
    static void set_level(std::string_view level);
    static void flush();
};

} // namespace dentassist

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::dentassist::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::dentassist::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::dentassist::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::dentassist::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::dentassist::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::dentassist::Logger::get(), __VA_ARGS__)
