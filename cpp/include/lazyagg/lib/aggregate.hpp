#pragma once

#include "../collection/pcollection.hpp"
#include "../collection/pobject.hpp"
#include "../core/combine_fn.hpp"
#include "../core/do_fn.hpp"
#include "../core/grouped_values.hpp"
#include "../core/ordering.hpp"
#include "extremum.hpp"
#include "top_k.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lazyagg {
namespace aggregate {

/**
 * Sentinel group keys. Scalar aggregates tag every partial result with one
 * constant key so that grouping yields a single group, whatever the number of
 * partitions or combine levels, and the combiner converges to one value.
 */
constexpr int32_t LENGTH_GROUP_KEY = 1;
constexpr bool MAX_GROUP_KEY = true;
constexpr bool MIN_GROUP_KEY = false;
constexpr int32_t TOP_OVERALL_STAGING_KEY = 0;

/**
 * Maps every distinct element to its number of occurrences.
 */
template<typename S>
PTable<S, int64_t> count(const PCollection<S>& collection) {
    return collection
        .parallel_do_table("Aggregate.count", map_fn<S, std::pair<S, int64_t>>([](const S& input) {
            return std::make_pair(input, int64_t{1});
        }))
        .group_by_key()
        .combine_values("Aggregate.count.sum", sum_longs<S>());
}

/**
 * Number of elements; reading it over an empty collection throws
 * EmptyAggregationError.
 */
template<typename S>
PObject<int64_t> length(const PCollection<S>& collection) {
    auto counts = collection
        .parallel_do_table("Aggregate.length", map_fn<S, std::pair<int32_t, int64_t>>([](const S&) {
            return std::make_pair(LENGTH_GROUP_KEY, int64_t{1});
        }))
        .group_by_key(1)
        .combine_values("Aggregate.length.sum", sum_longs<int32_t>());
    return first_element(counts.values(), "length of '" + collection.name() + "'");
}

template<typename S>
PObject<S> extremum(const PCollection<S>& collection, Ordering<S> ordering, bool maximize) {
    const std::string operation = maximize ? "max" : "min";
    require_total_order(ordering, operation);

    bool group_key = maximize ? MAX_GROUP_KEY : MIN_GROUP_KEY;
    auto extrema = collection
        .parallel_do_table(operation, ExtremumFn<S>(ordering, maximize, group_key))
        .group_by_key(1)
        .combine_values(operation + ".combine", ExtremumCombineFn<S>(ordering, maximize));
    return first_element(extrema.values(), operation + " of '" + collection.name() + "'");
}

/**
 * Largest element under the given ordering. Throws UnsupportedTypeError right
 * away when the ordering is empty; reading the result over an empty
 * collection throws EmptyAggregationError.
 */
template<typename S>
PObject<S> max(const PCollection<S>& collection, Ordering<S> ordering = natural_order<S>()) {
    return extremum(collection, std::move(ordering), true);
}

template<typename S>
PObject<S> min(const PCollection<S>& collection, Ordering<S> ordering = natural_order<S>()) {
    return extremum(collection, std::move(ordering), false);
}

template<typename SK, typename K, typename V>
PTable<K, V> staged_top(const PTable<K, V>& table, size_t limit, bool maximize, Ordering<V> ordering,
                        std::function<SK(const K&)> staging_key, size_t num_partitions_hint) {
    require_total_order(ordering, "top");
    if (limit == 0) {
        throw std::invalid_argument("top() needs a positive limit");
    }

    PairValueRank<K, V> rank(std::move(ordering), maximize);
    const std::string prefix = "top" + std::to_string(limit);

    return table
        .parallel_do_table(prefix + "map", TopKFn<SK, K, V>(limit, rank, std::move(staging_key)))
        .group_by_key(num_partitions_hint)
        .combine_values(prefix + "combine", TopKCombineFn<SK, K, V>(limit, rank))
        .parallel_do_table(prefix + "reduce", UnstageFn<SK, K, V>());
}

/**
 * Per key, the `limit` best values (largest when maximize, smallest
 * otherwise), best first. Keys with fewer values keep all of them. Equal
 * values are ranked by arrival order.
 */
template<typename K, typename V>
PTable<K, V> top(const PTable<K, V>& table, size_t limit, bool maximize,
                 Ordering<V> ordering = natural_order<V>()) {
    return staged_top<K, K, V>(table, limit, maximize, std::move(ordering),
                               [](const K& key) { return key; }, 0);
}

/**
 * The `limit` best pairs of the whole table regardless of key, best first.
 */
template<typename K, typename V>
PTable<K, V> top_overall(const PTable<K, V>& table, size_t limit, bool maximize,
                         Ordering<V> ordering = natural_order<V>()) {
    return staged_top<int32_t, K, V>(table, limit, maximize, std::move(ordering),
                                     [](const K&) { return TOP_OVERALL_STAGING_KEY; }, 1);
}

/**
 * All values of each key, detached from the grouped-values buffer. The order
 * of values within a key is unspecified.
 */
template<typename K, typename V>
PTable<K, std::vector<V>> collect_values(const PTable<K, V>& table) {
    return table.group_by_key().parallel_do_table(
        "collect",
        map_fn<Grouped<K, V>, std::pair<K, std::vector<V>>>([](const Grouped<K, V>& group) {
            std::vector<V> collected;
            collected.reserve(group.second.size());
            for (const auto& value : group.second) {
                collected.push_back(detach(value));
            }
            return std::make_pair(group.first, std::move(collected));
        }));
}

} // namespace aggregate
} // namespace lazyagg
