#include "lazyagg/dag/executor_options.hpp"
#include "lazyagg/util/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace lazyagg {
namespace dag {

namespace {

size_t parse_size(const char* variable, const std::string& text) {
    const std::string error = std::string(variable) + " must be a non-negative integer, got '" + text + "'";

    // Digits only: stoull would otherwise skip whitespace and wrap signed input
    bool digits_only = !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (!digits_only) {
        throw std::invalid_argument(error);
    }

    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(error);
    }
    return static_cast<size_t>(value);
}

bool parse_bool(const char* variable, std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
    if (text == "0" || text == "false" || text == "no" || text == "off") return false;
    throw std::invalid_argument(std::string(variable) + " must be a boolean, got '" + text + "'");
}

} // namespace

void ExecutorOptions::validate() const {
    if (num_partitions == 0) {
        throw std::invalid_argument("num_partitions must be at least 1");
    }
    if (num_reducers == 0) {
        throw std::invalid_argument("num_reducers must be at least 1");
    }
    if (combine_fan_in == 1) {
        throw std::invalid_argument("combine_fan_in must be 0 (disabled) or at least 2");
    }
}

std::string ExecutorOptions::to_string() const {
    std::ostringstream oss;
    oss << "ExecutorOptions(num_partitions=" << num_partitions
        << ", num_reducers=" << num_reducers
        << ", map_side_combine=" << (map_side_combine ? "true" : "false")
        << ", combine_fan_in=" << combine_fan_in << ")";
    return oss.str();
}

ExecutorOptions ExecutorOptions::from_environment() {
    ExecutorOptions options;

    if (const char* value = std::getenv("LAZYAGG_NUM_PARTITIONS")) {
        options.num_partitions = parse_size("LAZYAGG_NUM_PARTITIONS", value);
    }
    if (const char* value = std::getenv("LAZYAGG_NUM_REDUCERS")) {
        options.num_reducers = parse_size("LAZYAGG_NUM_REDUCERS", value);
    }
    if (const char* value = std::getenv("LAZYAGG_MAP_SIDE_COMBINE")) {
        options.map_side_combine = parse_bool("LAZYAGG_MAP_SIDE_COMBINE", value);
    }
    if (const char* value = std::getenv("LAZYAGG_COMBINE_FAN_IN")) {
        options.combine_fan_in = parse_size("LAZYAGG_COMBINE_FAN_IN", value);
    }

    options.validate();
    LAZYAGG_INFO("Loaded {} from environment", options.to_string());
    return options;
}

} // namespace dag
} // namespace lazyagg
