#include "lazyagg/util/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lazyagg {
namespace util {

namespace {

constexpr auto LOGGER_NAME = "lazyagg";
constexpr auto LOG_PATTERN = "%^[%H:%M:%S.%f] [%L] [%n] %v%$";

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> instance;
LogLevel current_level = LogLevel::WARNING;

std::shared_ptr<spdlog::logger> create_logger(LogLevel level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern(LOG_PATTERN);

    auto created = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    created->set_level(to_spdlog_level(level));
    created->flush_on(spdlog::level::warn);
    return created;
}

} // namespace

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARNING: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::warn;
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!instance) {
        instance = create_logger(current_level);
    }
    return instance;
}

void setup_logging(LogLevel level) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    current_level = level;
    instance = create_logger(level);
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    current_level = level;
    if (instance) {
        instance->set_level(to_spdlog_level(level));
    }
}

LogLevel log_level() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    return current_level;
}

} // namespace util
} // namespace lazyagg
