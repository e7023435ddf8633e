#pragma once

#include "../core/grouped_values.hpp"
#include "../dag/node.hpp"
#include "shuffle.hpp"
#include <string>
#include <utility>

namespace lazyagg {
namespace ops {

/**
 * GroupByKey operation - shuffles key-value pairs so that every value of a
 * key ends up in one grouped entry of one reducer partition
 * Values are neither sorted nor deduplicated
 */
template<typename K, typename V>
class GroupByKeyNode : public dag::DatasetNode<Grouped<K, V>> {
public:
    GroupByKeyNode(size_t num_partitions_hint, dag::ExecutorOptions options, std::string name = "group_by_key")
        : dag::DatasetNode<Grouped<K, V>>(dag::OperationType::GROUP_BY_KEY, std::move(name), std::move(options))
        , num_partitions_hint_(num_partitions_hint) {}

    size_t num_reducers() const {
        return num_partitions_hint_ > 0 ? num_partitions_hint_ : this->options_.num_reducers;
    }

    // The ungrouped table this node shuffles
    std::shared_ptr<dag::DatasetNode<std::pair<K, V>>> table() const {
        return dag::typed_input<std::pair<K, V>>(*this, 0);
    }

protected:
    dag::Partitions<Grouped<K, V>> compute() override {
        auto input = table()->execute();
        auto reducers = shuffle(*input, HashPartitioner<K>(num_reducers()));

        dag::Partitions<Grouped<K, V>> output;
        output.reserve(reducers.size());

        for (auto& groups : reducers) {
            std::vector<Grouped<K, V>> partition;
            partition.reserve(groups.size());
            for (auto& group : groups) {
                partition.emplace_back(std::move(group.first), GroupedValues<V>(std::move(group.second)));
            }
            output.push_back(std::move(partition));
        }

        return output;
    }

private:
    size_t num_partitions_hint_;
};

} // namespace ops
} // namespace lazyagg
