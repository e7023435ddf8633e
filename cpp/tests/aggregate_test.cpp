#include "lazyagg/lib/aggregate.hpp"
#include "test_util.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lazyagg {

namespace {

struct Point {
    int x;
    int y;
};

/**
 * Value whose copies share storage unless detached, like a reused record
 */
struct SharedBox {
    std::shared_ptr<int> value;
};

std::vector<int> pseudo_random_numbers(size_t n) {
    std::vector<int> numbers;
    uint32_t state = 12345;
    for (size_t i = 0; i < n; ++i) {
        state = state * 1103515245u + 12345u;
        numbers.push_back(static_cast<int>((state >> 16) % 1000) - 500);
    }
    return numbers;
}

} // namespace

template<>
struct Detach<SharedBox> {
    SharedBox operator()(const SharedBox& box) const { return SharedBox{std::make_shared<int>(*box.value)}; }
};

class AggregateTest : public test::LazyaggParamTest {};

TEST_P(AggregateTest, countOccurrences) {
    auto words = collection_of(pipeline, std::vector<std::string>{"a", "b", "a", "c", "b", "a"});

    auto counts = aggregate::count(words).materialize_to_map();

    EXPECT_EQ(counts.size(), 3u);
    EXPECT_EQ(counts.at("a"), 3);
    EXPECT_EQ(counts.at("b"), 2);
    EXPECT_EQ(counts.at("c"), 1);
}

TEST_P(AggregateTest, countsAddUpToTheCollectionSize) {
    auto values = pseudo_random_numbers(200);
    std::map<int, int64_t> expected;
    for (int v : values) {
        expected[v % 7]++;
    }

    auto numbers = collection_of(pipeline, values);
    auto buckets = numbers.map("bucket", [](const int& n) { return n % 7; });
    auto counts = aggregate::count(buckets).materialize();

    int64_t total = 0;
    std::map<int, int64_t> seen;
    for (const auto& entry : counts) {
        EXPECT_EQ(seen.count(entry.first), 0u);
        seen[entry.first] = entry.second;
        total += entry.second;
    }
    EXPECT_EQ(total, 200);
    EXPECT_EQ(seen, expected);
}

TEST_P(AggregateTest, countOfEmptyCollectionIsEmpty) {
    auto empty = collection_of(pipeline, std::vector<std::string>{});

    EXPECT_TRUE(aggregate::count(empty).materialize().empty());
}

TEST_P(AggregateTest, lengthCountsElements) {
    auto numbers = collection_of(pipeline, pseudo_random_numbers(37));

    auto length = aggregate::length(numbers);

    EXPECT_FALSE(length.is_resolved());
    EXPECT_EQ(length.get(), 37);
    EXPECT_TRUE(length.is_resolved());
}

TEST_P(AggregateTest, lengthOfEmptyCollectionThrowsOnRead) {
    auto empty = collection_of(pipeline, std::vector<int>{}, "nothing");

    auto length = aggregate::length(empty);

    EXPECT_THROW(length.get(), EmptyAggregationError);
}

TEST_P(AggregateTest, maxAndMin) {
    auto numbers = collection_of(pipeline, std::vector<int>{3, 1, 4, 1, 5, 9, 2, 6});

    EXPECT_EQ(aggregate::max(numbers).get(), 9);
    EXPECT_EQ(aggregate::min(numbers).get(), 1);
}

TEST_P(AggregateTest, extremaMatchSequentialFold) {
    auto values = pseudo_random_numbers(500);
    auto numbers = collection_of(pipeline, values);

    int expected_max = values.front();
    int expected_min = values.front();
    for (int v : values) {
        expected_max = std::max(expected_max, v);
        expected_min = std::min(expected_min, v);
    }

    EXPECT_EQ(aggregate::max(numbers).get(), expected_max);
    EXPECT_EQ(aggregate::min(numbers).get(), expected_min);
}

TEST_P(AggregateTest, extremaOfStrings) {
    auto words = collection_of(pipeline, std::vector<std::string>{"pear", "apple", "quince", "fig"});

    EXPECT_EQ(aggregate::max(words).get(), "quince");
    EXPECT_EQ(aggregate::min(words).get(), "apple");
}

TEST_P(AggregateTest, extremaUseTheGivenOrdering) {
    auto words = collection_of(pipeline, std::vector<std::string>{"pear", "apple", "quince", "fig"});
    Ordering<std::string> by_length([](const std::string& left, const std::string& right) {
        return static_cast<int>(left.size()) - static_cast<int>(right.size());
    });

    EXPECT_EQ(aggregate::max(words, by_length).get(), "quince");
    EXPECT_EQ(aggregate::min(words, by_length).get(), "fig");
}

TEST_P(AggregateTest, extremaOfEmptyCollectionThrowOnRead) {
    auto empty = collection_of(pipeline, std::vector<int>{});

    auto largest = aggregate::max(empty);
    auto smallest = aggregate::min(empty);

    EXPECT_THROW(largest.get(), EmptyAggregationError);
    EXPECT_THROW(smallest.get(), EmptyAggregationError);
}

TEST_P(AggregateTest, unorderableTypeIsRejectedBeforeAnyNodeIsAdded) {
    auto points = collection_of(pipeline, std::vector<Point>{{1, 2}, {3, 4}});
    size_t nodes_before = pipeline->nodes().size();

    EXPECT_THROW(aggregate::max(points), UnsupportedTypeError);
    EXPECT_THROW(aggregate::min(points), UnsupportedTypeError);
    EXPECT_EQ(pipeline->nodes().size(), nodes_before);
}

TEST_P(AggregateTest, scalarResultsAreResolvedOnce) {
    auto numbers = collection_of(pipeline, std::vector<int>{2, 8, 5});
    auto largest = aggregate::max(numbers);

    EXPECT_EQ(largest.get(), 8);
    auto copy = largest;
    EXPECT_TRUE(copy.is_resolved());
    EXPECT_EQ(&copy.get(), &largest.get());
}

TEST_P(AggregateTest, collectValuesGathersEveryValueOfAKey) {
    auto table = table_of(pipeline, std::vector<std::pair<std::string, int>>{{"k", 1}, {"k", 2}, {"k", 3}});

    auto collected = aggregate::collect_values(table).materialize_to_map();

    ASSERT_EQ(collected.size(), 1u);
    EXPECT_EQ(test::sorted(collected.at("k")), (std::vector<int>{1, 2, 3}));
}

TEST_P(AggregateTest, collectValuesKeepsKeysApart) {
    std::vector<std::pair<int, int>> pairs;
    for (int i = 0; i < 60; ++i) {
        pairs.emplace_back(i % 6, i);
    }
    auto table = table_of(pipeline, pairs);

    auto collected = aggregate::collect_values(table).materialize();

    ASSERT_EQ(collected.size(), 6u);
    for (const auto& entry : collected) {
        ASSERT_EQ(entry.second.size(), 10u);
        for (int value : entry.second) {
            EXPECT_EQ(value % 6, entry.first);
        }
    }
}

TEST_P(AggregateTest, collectValuesDetachesFromTheGroupBuffer) {
    auto table = table_of(pipeline, std::vector<std::pair<std::string, SharedBox>>{
        {"k", SharedBox{std::make_shared<int>(1)}},
        {"k", SharedBox{std::make_shared<int>(2)}}});
    auto source = table.materialize();

    auto collected = aggregate::collect_values(table).materialize();

    ASSERT_EQ(collected.size(), 1u);
    ASSERT_EQ(collected[0].second.size(), 2u);
    std::vector<int> values;
    for (const auto& box : collected[0].second) {
        EXPECT_NE(box.value, source[0].second.value);
        EXPECT_NE(box.value, source[1].second.value);
        values.push_back(*box.value);
    }
    EXPECT_EQ(test::sorted(values), (std::vector<int>{1, 2}));
}

INSTANTIATE_TEST_SUITE_P(ExecutorShapes,
                         AggregateTest,
                         ::testing::ValuesIn(test::executor_configurations()),
                         test::configuration_name);

} // namespace lazyagg
