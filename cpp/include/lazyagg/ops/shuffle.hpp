#pragma once

#include "../dag/node.hpp"
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lazyagg {
namespace ops {

// Values of each distinct key, keys in order of first arrival
template<typename K, typename V>
using KeyGroups = std::vector<std::pair<K, std::vector<V>>>;

template<typename K>
class HashPartitioner {
public:
    explicit HashPartitioner(size_t num_partitions) : num_partitions_(num_partitions) {
        if (num_partitions_ == 0) {
            throw std::invalid_argument("HashPartitioner needs at least one partition");
        }
    }

    size_t partition(const K& key) const { return hasher_(key) % num_partitions_; }
    size_t num_partitions() const { return num_partitions_; }

private:
    size_t num_partitions_;
    std::hash<K> hasher_;
};

template<typename K, typename V>
KeyGroups<K, V> group_locally(const std::vector<std::pair<K, V>>& pairs) {
    KeyGroups<K, V> groups;
    std::unordered_map<K, size_t> index;

    for (const auto& pair : pairs) {
        auto it = index.find(pair.first);
        if (it == index.end()) {
            index.emplace(pair.first, groups.size());
            groups.emplace_back(pair.first, std::vector<V>{pair.second});
        } else {
            groups[it->second].second.push_back(pair.second);
        }
    }

    return groups;
}

/**
 * Routes every pair to the reducer its key hashes to and groups each
 * reducer's pairs by key. Input partitions are consumed in index order, so
 * the value order within a group is deterministic.
 */
template<typename K, typename V>
std::vector<KeyGroups<K, V>> shuffle(const dag::Partitions<std::pair<K, V>>& input,
                                     const HashPartitioner<K>& partitioner) {
    dag::Partitions<std::pair<K, V>> routed(partitioner.num_partitions());
    for (const auto& partition : input) {
        for (const auto& pair : partition) {
            routed[partitioner.partition(pair.first)].push_back(pair);
        }
    }

    std::vector<KeyGroups<K, V>> reducers;
    reducers.reserve(routed.size());
    for (const auto& pairs : routed) {
        reducers.push_back(group_locally(pairs));
    }
    return reducers;
}

} // namespace ops
} // namespace lazyagg
