#pragma once

#include <cstddef>
#include <string>

namespace lazyagg {
namespace dag {

/**
 * Knobs of the in-memory executor.
 *
 * The defaults reproduce a single-partition run in which every combiner is
 * invoked exactly once per key. Raising num_partitions / num_reducers, turning
 * on map_side_combine or setting combine_fan_in makes the executor split data
 * and re-apply combiners the way a distributed engine would.
 */
struct ExecutorOptions {
    size_t num_partitions = 1;     // splits of every source collection
    size_t num_reducers = 1;       // group_by_key partitions when no hint is given
    bool map_side_combine = false; // run the combiner on each input partition before the shuffle
    size_t combine_fan_in = 0;     // 0: no intermediate combine levels, else values per combine call

    // Throws std::invalid_argument on inconsistent settings
    void validate() const;

    std::string to_string() const;

    /**
     * Defaults overridden by LAZYAGG_NUM_PARTITIONS, LAZYAGG_NUM_REDUCERS,
     * LAZYAGG_MAP_SIDE_COMBINE and LAZYAGG_COMBINE_FAN_IN where set.
     */
    static ExecutorOptions from_environment();
};

} // namespace dag
} // namespace lazyagg
