#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace lazyagg {
namespace util {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    OFF
};

/**
 * Process-wide library logger ("lazyagg")
 * Created lazily on first use with a stderr sink at WARNING level
 */
std::shared_ptr<spdlog::logger> logger();

// Re-creates the logger sinks and applies the given level
void setup_logging(LogLevel level);

void set_log_level(LogLevel level);
LogLevel log_level();

spdlog::level::level_enum to_spdlog_level(LogLevel level);

} // namespace util
} // namespace lazyagg

#define LAZYAGG_TRACE(...) ::lazyagg::util::logger()->trace(__VA_ARGS__)
#define LAZYAGG_DEBUG(...) ::lazyagg::util::logger()->debug(__VA_ARGS__)
#define LAZYAGG_INFO(...) ::lazyagg::util::logger()->info(__VA_ARGS__)
#define LAZYAGG_WARNING(...) ::lazyagg::util::logger()->warn(__VA_ARGS__)
#define LAZYAGG_ERROR(...) ::lazyagg::util::logger()->error(__VA_ARGS__)
