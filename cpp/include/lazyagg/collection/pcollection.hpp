#pragma once

#include "../core/combine_fn.hpp"
#include "../core/do_fn.hpp"
#include "../core/errors.hpp"
#include "../core/grouped_values.hpp"
#include "../dag/node.hpp"
#include "../dag/pipeline.hpp"
#include "../ops/combine_values.hpp"
#include "../ops/group_by_key.hpp"
#include "../ops/parallel_do.hpp"
#include "../ops/union.hpp"
#include "pobject.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lazyagg {

template<typename K, typename V>
class PTable;

template<typename K, typename V>
class PGroupedTable;

template<typename T>
struct pair_traits;

template<typename K, typename V>
struct pair_traits<std::pair<K, V>> {
    using key_type = K;
    using value_type = V;
};

/**
 * Lazy, partitioned multiset of elements.
 *
 * A PCollection is a cheap handle on one node of its pipeline's plan. Every
 * operation adds a node and returns a new handle; nothing is computed until
 * materialize() or a PObject built from the collection is read.
 */
template<typename S>
class PCollection {
public:
    using element_type = S;

    PCollection(std::shared_ptr<dag::Pipeline> pipeline, std::shared_ptr<dag::DatasetNode<S>> node)
        : pipeline_(std::move(pipeline)), node_(std::move(node)) {
        if (!pipeline_ || !node_) {
            throw std::invalid_argument("PCollection needs a pipeline and a node");
        }
    }

    const std::shared_ptr<dag::Pipeline>& pipeline() const { return pipeline_; }
    const std::shared_ptr<dag::DatasetNode<S>>& node() const { return node_; }
    const std::string& name() const { return node_->name(); }

    // Applies a DoFn prototype; each partition runs its own copy
    template<typename Fn>
    PCollection<typename Fn::output_type> parallel_do(const std::string& name, Fn fn) const {
        static_assert(std::is_same<typename Fn::input_type, S>::value, "DoFn input type must match the collection");
        using T = typename Fn::output_type;

        auto node = std::make_shared<ops::ParallelDoNode<S, T>>(
            prototype_factory(std::move(fn)), pipeline_->options(), name);
        node->add_input(node_);
        pipeline_->add_node(node);
        return PCollection<T>(pipeline_, node);
    }

    // Same as parallel_do, for DoFns emitting key-value pairs
    template<typename Fn>
    PTable<typename pair_traits<typename Fn::output_type>::key_type,
           typename pair_traits<typename Fn::output_type>::value_type>
    parallel_do_table(const std::string& name, Fn fn) const {
        using K = typename pair_traits<typename Fn::output_type>::key_type;
        using V = typename pair_traits<typename Fn::output_type>::value_type;

        PCollection<std::pair<K, V>> pairs = parallel_do(name, std::move(fn));
        return PTable<K, V>(pairs.pipeline(), pairs.node());
    }

    template<typename F>
    PCollection<std::decay_t<std::invoke_result_t<F&, const S&>>> map(const std::string& name, F func) const {
        using T = std::decay_t<std::invoke_result_t<F&, const S&>>;
        return parallel_do(name, map_fn<S, T>(std::move(func)));
    }

    template<typename F>
    PCollection<S> filter(const std::string& name, F predicate) const {
        return parallel_do(name, filter_fn<S>(std::move(predicate)));
    }

    // Keys every element by key_fn(element)
    template<typename F>
    PTable<std::decay_t<std::invoke_result_t<F&, const S&>>, S> by(const std::string& name, F key_fn) const {
        using K = std::decay_t<std::invoke_result_t<F&, const S&>>;
        return parallel_do_table(name, map_fn<S, std::pair<K, S>>([key_fn](const S& element) mutable {
            return std::make_pair(key_fn(element), element);
        }));
    }

    PCollection<S> union_with(const PCollection<S>& other) const {
        return union_with(std::vector<PCollection<S>>{other});
    }

    PCollection<S> union_with(const std::vector<PCollection<S>>& others) const {
        auto node = std::make_shared<ops::UnionNode<S>>(pipeline_->options(), "union");
        node->add_input(node_);
        for (const auto& other : others) {
            if (other.pipeline() != pipeline_) {
                throw std::invalid_argument("Cannot union '" + other.name() + "' from pipeline '" +
                                            other.pipeline()->name() + "' into pipeline '" +
                                            pipeline_->name() + "'");
            }
            node->add_input(other.node());
        }
        pipeline_->add_node(node);
        return PCollection<S>(pipeline_, node);
    }

    // Runs the plan up to this node; partitions are concatenated in order
    std::vector<S> materialize() const {
        auto partitions = node_->execute();

        std::vector<S> elements;
        for (const auto& partition : *partitions) {
            elements.insert(elements.end(), partition.begin(), partition.end());
        }
        return elements;
    }

    size_t size() const {
        auto partitions = node_->execute();

        size_t total = 0;
        for (const auto& partition : *partitions) {
            total += partition.size();
        }
        return total;
    }

    PObject<std::vector<S>> as_collection() const {
        PCollection<S> self = *this;
        return PObject<std::vector<S>>([self]() { return self.materialize(); }, name());
    }

protected:
    std::shared_ptr<dag::Pipeline> pipeline_;
    std::shared_ptr<dag::DatasetNode<S>> node_;
};

/**
 * Lazy, partitioned multimap from K to V. Keys are not unique until
 * group_by_key has run.
 */
template<typename K, typename V>
class PTable : public PCollection<std::pair<K, V>> {
public:
    using key_type = K;
    using value_type = V;

    PTable(std::shared_ptr<dag::Pipeline> pipeline, std::shared_ptr<dag::DatasetNode<std::pair<K, V>>> node)
        : PCollection<std::pair<K, V>>(std::move(pipeline), std::move(node)) {}

    // 0 lets the executor pick the number of reducer partitions
    PGroupedTable<K, V> group_by_key(size_t num_partitions_hint = 0) const {
        auto node = std::make_shared<ops::GroupByKeyNode<K, V>>(
            num_partitions_hint, this->pipeline_->options(), "group_by_key");
        node->add_input(this->node_);
        this->pipeline_->add_node(node);
        return PGroupedTable<K, V>(this->pipeline_, node);
    }

    PCollection<V> values() const {
        return this->parallel_do("values", map_fn<std::pair<K, V>, V>([](const std::pair<K, V>& pair) {
            return pair.second;
        }));
    }

    PCollection<K> keys() const {
        return this->parallel_do("keys", map_fn<std::pair<K, V>, K>([](const std::pair<K, V>& pair) {
            return pair.first;
        }));
    }

    PTable<K, V> union_with(const PTable<K, V>& other) const {
        PCollection<std::pair<K, V>> pairs = PCollection<std::pair<K, V>>::union_with(other);
        return PTable<K, V>(pairs.pipeline(), pairs.node());
    }

    // Later pairs overwrite earlier ones with the same key
    std::unordered_map<K, V> materialize_to_map() const {
        std::unordered_map<K, V> map;
        for (auto& pair : this->materialize()) {
            map[pair.first] = std::move(pair.second);
        }
        return map;
    }
};

/**
 * Result of group_by_key: one entry per distinct key per reducer partition.
 */
template<typename K, typename V>
class PGroupedTable : public PCollection<Grouped<K, V>> {
public:
    PGroupedTable(std::shared_ptr<dag::Pipeline> pipeline, std::shared_ptr<ops::GroupByKeyNode<K, V>> node)
        : PCollection<Grouped<K, V>>(std::move(pipeline), node)
        , group_node_(std::move(node)) {}

    // Applies the combiner at whichever levels the executor chooses
    template<typename Fn>
    PTable<K, V> combine_values(const std::string& name, Fn combine_fn) const {
        static_assert(std::is_base_of<CombineFn<K, V>, Fn>::value, "combine_values needs a CombineFn<K, V>");

        auto node = std::make_shared<ops::CombineValuesNode<K, V>>(
            prototype_factory(std::move(combine_fn)), this->pipeline_->options(), name);
        node->add_input(group_node_);
        this->pipeline_->add_node(node);
        return PTable<K, V>(this->pipeline_, node);
    }

    size_t num_reducers() const { return group_node_->num_reducers(); }

private:
    std::shared_ptr<ops::GroupByKeyNode<K, V>> group_node_;
};

template<typename S>
PCollection<S> collection_of(const std::shared_ptr<dag::Pipeline>& pipeline, std::vector<S> elements,
                             const std::string& name = "source") {
    auto node = std::make_shared<dag::SourceNode<S>>(std::move(elements), pipeline->options(), name);
    pipeline->add_node(node);
    return PCollection<S>(pipeline, node);
}

template<typename K, typename V>
PTable<K, V> table_of(const std::shared_ptr<dag::Pipeline>& pipeline, std::vector<std::pair<K, V>> pairs,
                      const std::string& name = "source") {
    auto node = std::make_shared<dag::SourceNode<std::pair<K, V>>>(std::move(pairs), pipeline->options(), name);
    pipeline->add_node(node);
    return PTable<K, V>(pipeline, node);
}

/**
 * Scalar view of a collection that holds (at most) one element by
 * construction, such as the values of a table grouped on a sentinel key.
 * The first element in partition order is returned; an empty collection
 * raises EmptyAggregationError when the value is read.
 */
template<typename S>
PObject<S> first_element(const PCollection<S>& collection, const std::string& description) {
    auto node = collection.node();
    return PObject<S>([node, description]() -> S {
        auto partitions = node->execute();
        for (const auto& partition : *partitions) {
            if (!partition.empty()) {
                return partition.front();
            }
        }
        throw EmptyAggregationError(description);
    }, description);
}

} // namespace lazyagg
