#pragma once

#include "lazyagg/dag/executor_options.hpp"
#include "lazyagg/dag/pipeline.hpp"
#include "lazyagg/util/logger.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace lazyagg {
namespace dag {

// Found by gtest through ADL when naming parameters in test output
inline void PrintTo(const ExecutorOptions& options, std::ostream* os) { *os << options.to_string(); }

} // namespace dag

namespace test {

inline dag::ExecutorOptions make_options(size_t num_partitions, size_t num_reducers, bool map_side_combine,
                                         size_t combine_fan_in) {
    dag::ExecutorOptions options;
    options.num_partitions = num_partitions;
    options.num_reducers = num_reducers;
    options.map_side_combine = map_side_combine;
    options.combine_fan_in = combine_fan_in;
    return options;
}

/**
 * Executor shapes every aggregation must give the same answer under:
 * single pass, many partitions, map-side combining and multi-level combining.
 */
inline std::vector<dag::ExecutorOptions> executor_configurations() {
    return {
        dag::ExecutorOptions(),
        make_options(4, 1, false, 0),
        make_options(3, 2, true, 0),
        make_options(5, 3, true, 2),
        make_options(1, 1, false, 3),
        make_options(7, 4, true, 3),
    };
}

inline std::string configuration_name(const ::testing::TestParamInfo<dag::ExecutorOptions>& info) {
    const auto& o = info.param;
    return "p" + std::to_string(o.num_partitions) + "_r" + std::to_string(o.num_reducers) +
           (o.map_side_combine ? "_mapside" : "") + "_fanin" + std::to_string(o.combine_fan_in);
}

/**
 * Base fixture: debug logging for the suite, a fresh pipeline per test
 */
class LazyaggTest : public ::testing::Test {
public:
    static void SetUpTestCase() { util::setup_logging(util::LogLevel::DEBUG); }

protected:
    void SetUp() override { pipeline = dag::Pipeline::create(dag::ExecutorOptions(), "test"); }

    std::shared_ptr<dag::Pipeline> pipeline;
};

class LazyaggParamTest : public ::testing::TestWithParam<dag::ExecutorOptions> {
public:
    static void SetUpTestCase() { util::setup_logging(util::LogLevel::DEBUG); }

protected:
    void SetUp() override { pipeline = dag::Pipeline::create(GetParam(), "test"); }

    std::shared_ptr<dag::Pipeline> pipeline;
};

template<typename T>
std::vector<T> sorted(std::vector<T> values) {
    std::sort(values.begin(), values.end());
    return values;
}

} // namespace test
} // namespace lazyagg
