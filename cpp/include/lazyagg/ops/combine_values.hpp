#pragma once

#include "../core/combine_fn.hpp"
#include "../core/emitter.hpp"
#include "../dag/node.hpp"
#include "group_by_key.hpp"
#include "shuffle.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace lazyagg {
namespace ops {

/**
 * CombineValues operation - group by key with a combiner applied at every
 * level the executor options ask for:
 *
 *   1. map side, once per input partition (map_side_combine)
 *   2. intermediate levels over runs of combine_fan_in values of a key,
 *      repeated while that keeps shrinking the key's value count
 *   3. reduce side, exactly once per key
 *
 * The input of this node is the GroupByKeyNode it replaces at execution time;
 * that node's own output is never computed.
 */
template<typename K, typename V>
class CombineValuesNode : public dag::DatasetNode<std::pair<K, V>> {
public:
    using CombineFactory = DoFnFactory<Grouped<K, V>, std::pair<K, V>>;

    CombineValuesNode(CombineFactory factory, dag::ExecutorOptions options, std::string name = "combine_values")
        : dag::DatasetNode<std::pair<K, V>>(dag::OperationType::COMBINE_VALUES, std::move(name), std::move(options))
        , factory_(std::move(factory)) {}

protected:
    dag::Partitions<std::pair<K, V>> compute() override {
        if (this->inputs_.empty()) {
            throw std::runtime_error("CombineValuesNode requires at least one input");
        }
        auto grouped = std::dynamic_pointer_cast<GroupByKeyNode<K, V>>(this->inputs_[0]);
        if (!grouped) {
            throw std::runtime_error("CombineValuesNode '" + this->name_ + "' must consume a GroupByKeyNode");
        }

        auto table = grouped->table()->execute();
        const dag::Partitions<std::pair<K, V>>* shuffle_input = table.get();

        dag::Partitions<std::pair<K, V>> map_side;
        if (this->options_.map_side_combine) {
            map_side.reserve(table->size());
            for (const auto& partition : *table) {
                map_side.push_back(combine_groups(group_locally(partition)));
            }
            shuffle_input = &map_side;
        }

        auto reducers = shuffle(*shuffle_input, HashPartitioner<K>(grouped->num_reducers()));

        dag::Partitions<std::pair<K, V>> output;
        output.reserve(reducers.size());
        for (auto& groups : reducers) {
            for (auto& group : groups) {
                group.second = combine_intermediate(group.first, std::move(group.second));
            }
            output.push_back(combine_groups(std::move(groups)));
        }

        return output;
    }

private:
    // One combiner instance per call, covering every group passed in
    std::vector<std::pair<K, V>> combine_groups(KeyGroups<K, V> groups) const {
        auto fn = factory_();
        VectorEmitter<std::pair<K, V>> emitter;

        fn->initialize();
        for (auto& group : groups) {
            fn->process(Grouped<K, V>(group.first, GroupedValues<V>(std::move(group.second))), emitter);
        }
        fn->cleanup(emitter);

        return emitter.take();
    }

    std::vector<V> combine_intermediate(const K& key, std::vector<V> values) const {
        size_t fan_in = this->options_.combine_fan_in;
        if (fan_in < 2) {
            return values;
        }

        size_t level = 0;
        while (values.size() > fan_in) {
            std::vector<V> next;
            for (size_t begin = 0; begin < values.size(); begin += fan_in) {
                size_t end = std::min(begin + fan_in, values.size());

                KeyGroups<K, V> chunk;
                chunk.emplace_back(key, std::vector<V>(values.begin() + begin, values.begin() + end));
                for (auto& pair : combine_groups(std::move(chunk))) {
                    next.push_back(std::move(pair.second));
                }
            }

            ++level;
            LAZYAGG_TRACE("'{}' combine level {}: {} -> {} values", this->name_, level, values.size(), next.size());

            if (next.size() >= values.size()) {
                return next;
            }
            values = std::move(next);
        }

        return values;
    }

    CombineFactory factory_;
};

} // namespace ops
} // namespace lazyagg
