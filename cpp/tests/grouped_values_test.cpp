#include "lazyagg/core/grouped_values.hpp"
#include "test_util.hpp"

#include <string>
#include <vector>

namespace lazyagg {

TEST(GroupedValuesTest, iteratesAllValues) {
    GroupedValues<int> values(std::vector<int>{3, 1, 2});

    std::vector<int> seen;
    for (const auto& value : values) {
        seen.push_back(value);
    }

    EXPECT_EQ(values.size(), 3u);
    EXPECT_EQ(seen, (std::vector<int>{3, 1, 2}));
}

TEST(GroupedValuesTest, emptyGroupHasNoIterations) {
    GroupedValues<std::string> values;

    EXPECT_TRUE(values.empty());
    EXPECT_TRUE(values.begin() == values.end());
}

/**
 * @brief A reference taken in one step points into the shared buffer and
 * sees the next value after an increment; a detached copy does not.
 */
TEST(GroupedValuesTest, bufferIsReusedBetweenSteps) {
    GroupedValues<std::string> values(std::vector<std::string>{"alpha", "beta"});

    auto it = values.begin();
    const std::string& held = *it;
    std::string detached = detach(*it);

    ++it;

    EXPECT_EQ(detached, "alpha");
    EXPECT_EQ(held, "beta");
    EXPECT_EQ(&held, &*it);
}

TEST(GroupedValuesTest, canBeIteratedAgain) {
    GroupedValues<int> values(std::vector<int>{1, 2});

    int first_pass = 0;
    for (int value : values) {
        first_pass += value;
    }
    int second_pass = 0;
    for (int value : values) {
        second_pass += value;
    }

    EXPECT_EQ(first_pass, 3);
    EXPECT_EQ(second_pass, 3);
}

} // namespace lazyagg
