#include "lazyagg/collection/pcollection.hpp"
#include "lazyagg/core/combine_fn.hpp"
#include "test_util.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lazyagg {

namespace {

struct CombineCalls {
    int groups = 0;
    int values = 0;
};

/**
 * Summing combiner that counts how many groups and values it was handed
 */
class CountingSumFn : public CombineFn<std::string, int64_t> {
public:
    explicit CountingSumFn(std::shared_ptr<CombineCalls> calls) : calls_(std::move(calls)) {}

    void process(const Grouped<std::string, int64_t>& input,
                 Emitter<std::pair<std::string, int64_t>>& emitter) override {
        calls_->groups++;
        int64_t sum = 0;
        for (const auto& value : input.second) {
            calls_->values++;
            sum += value;
        }
        emitter.emit(std::make_pair(input.first, sum));
    }

private:
    std::shared_ptr<CombineCalls> calls_;
};

// Emits every value back unchanged, so no combine level shrinks the group
class IdentityCombineFn : public CombineFn<int, int> {
public:
    void process(const Grouped<int, int>& input, Emitter<std::pair<int, int>>& emitter) override {
        for (const auto& value : input.second) {
            emitter.emit(std::make_pair(input.first, value));
        }
    }
};

std::vector<std::pair<std::string, int64_t>> weighted_words() {
    std::vector<std::pair<std::string, int64_t>> pairs;
    for (int64_t i = 1; i <= 40; ++i) {
        pairs.emplace_back("w" + std::to_string(i % 5), i);
    }
    return pairs;
}

std::map<std::string, int64_t> expected_sums() {
    std::map<std::string, int64_t> sums;
    for (const auto& pair : weighted_words()) {
        sums[pair.first] += pair.second;
    }
    return sums;
}

} // namespace

class CombineValuesTest : public test::LazyaggTest {};

TEST_F(CombineValuesTest, combinerSeesEveryKeyExactlyOnceByDefault) {
    auto calls = std::make_shared<CombineCalls>();
    auto table = table_of(pipeline, weighted_words());

    auto sums = table.group_by_key().combine_values("sum", CountingSumFn(calls));
    auto result = sums.materialize();

    EXPECT_EQ(result.size(), 5u);
    EXPECT_EQ(calls->groups, 5);
    EXPECT_EQ(calls->values, 40);
}

TEST_F(CombineValuesTest, nothingRunsUntilMaterialized) {
    auto calls = std::make_shared<CombineCalls>();
    auto table = table_of(pipeline, weighted_words());

    auto sums = table.group_by_key().combine_values("sum", CountingSumFn(calls));

    EXPECT_EQ(calls->groups, 0);
    EXPECT_FALSE(sums.node()->is_materialized());
    EXPECT_EQ(sums.node()->type(), dag::OperationType::COMBINE_VALUES);
}

TEST_F(CombineValuesTest, mapSideCombineInvokesCombinerPerPartition) {
    auto calls = std::make_shared<CombineCalls>();
    auto split = dag::Pipeline::create(test::make_options(4, 1, true, 0), "mapside");
    auto table = table_of(split, weighted_words());

    auto result = table.group_by_key().combine_values("sum", CountingSumFn(calls)).materialize_to_map();

    // Four partitions of ten pairs each hold all five keys
    EXPECT_EQ(calls->groups, 4 * 5 + 5);
    EXPECT_EQ(calls->values, 40 + 4 * 5);
    for (const auto& expected : expected_sums()) {
        EXPECT_EQ(result.at(expected.first), expected.second);
    }
}

TEST_F(CombineValuesTest, fanInAddsIntermediateLevels) {
    auto calls = std::make_shared<CombineCalls>();
    auto layered = dag::Pipeline::create(test::make_options(1, 1, false, 2), "layered");
    auto table = table_of(layered, std::vector<std::pair<std::string, int64_t>>{
        {"k", 1}, {"k", 2}, {"k", 3}, {"k", 4}, {"k", 5}});

    auto result = table.group_by_key().combine_values("sum", CountingSumFn(calls)).materialize();

    // 5 values -> 3 -> 2, then the final reduce-side call
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].second, 15);
    EXPECT_EQ(calls->groups, 3 + 2 + 1);
}

TEST_F(CombineValuesTest, nonShrinkingCombinerStillTerminates) {
    auto layered = dag::Pipeline::create(test::make_options(2, 1, true, 2), "identity");
    auto table = table_of(layered, std::vector<std::pair<int, int>>{{1, 10}, {1, 20}, {1, 30}, {1, 40}});

    auto result = table.group_by_key().combine_values("identity", IdentityCombineFn()).materialize();

    std::vector<int> values;
    for (const auto& pair : result) {
        EXPECT_EQ(pair.first, 1);
        values.push_back(pair.second);
    }
    EXPECT_EQ(test::sorted(values), (std::vector<int>{10, 20, 30, 40}));
}

TEST_F(CombineValuesTest, binaryCombineFnFoldsWithOperator) {
    auto table = table_of(pipeline, std::vector<std::pair<std::string, int>>{{"a", 3}, {"b", 4}, {"a", 5}});

    auto products = table.group_by_key().combine_values(
        "product", binary_combine_fn<std::string, int>([](int left, int right) { return left * right; }));

    auto result = products.materialize_to_map();
    EXPECT_EQ(result.at("a"), 15);
    EXPECT_EQ(result.at("b"), 4);
}

class CombineValuesConfigTest : public test::LazyaggParamTest {};

TEST_P(CombineValuesConfigTest, sumsAgreeWithSequentialSum) {
    auto table = table_of(pipeline, weighted_words());

    auto result = table.group_by_key().combine_values("sum", sum_longs<std::string>()).materialize();

    std::map<std::string, int64_t> sums;
    for (const auto& pair : result) {
        ASSERT_EQ(sums.count(pair.first), 0u) << "key " << pair.first << " emitted twice";
        sums[pair.first] = pair.second;
    }
    EXPECT_EQ(sums, expected_sums());
}

INSTANTIATE_TEST_SUITE_P(ExecutorShapes,
                         CombineValuesConfigTest,
                         ::testing::ValuesIn(test::executor_configurations()),
                         test::configuration_name);

} // namespace lazyagg
