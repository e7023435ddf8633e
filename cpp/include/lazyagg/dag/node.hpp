#pragma once

#include "executor_options.hpp"
#include "../util/logger.hpp"
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lazyagg {
namespace dag {

enum class OperationType {
    SOURCE,         // In-memory elements split into partitions
    PARALLEL_DO,    // DoFn over every partition
    GROUP_BY_KEY,   // Shuffle by key into grouped entries
    COMBINE_VALUES, // Group by key with combiner applied at every level
    UNION           // Concatenation of inputs
};

std::string to_string(OperationType type);

template<typename T>
using Partitions = std::vector<std::vector<T>>;

/**
 * Abstract base class for plan nodes
 * Each node is one lazy operation of a pipeline; it computes nothing until
 * a downstream result is materialized
 */
class Node {
public:
    Node(OperationType type, std::string name, ExecutorOptions options);
    virtual ~Node() = default;

    // DAG structure
    void add_input(std::shared_ptr<Node> input);
    const std::vector<std::shared_ptr<Node>>& inputs() const { return inputs_; }

    // Metadata
    OperationType type() const { return type_; }
    size_t id() const { return id_; }
    const std::string& name() const { return name_; }
    void set_name(const std::string& name) { name_ = name; }
    const ExecutorOptions& options() const { return options_; }

    bool is_materialized() const { return cache_valid_; }

protected:
    OperationType type_;
    size_t id_;
    std::string name_;
    ExecutorOptions options_;
    std::vector<std::shared_ptr<Node>> inputs_;

    // Memoization flag, the cached partitions live in the typed subclass
    mutable bool cache_valid_ = false;
};

/**
 * Node producing partitioned elements of type T
 */
template<typename T>
class DatasetNode : public Node {
public:
    using element_type = T;
    using Result = std::shared_ptr<const Partitions<T>>;

    using Node::Node;

    // Runs the node (and, transitively, its inputs) once and caches the partitions
    Result execute() {
        if (cache_valid_ && cached_result_) {
            return cached_result_;
        }

        LAZYAGG_DEBUG("Executing {} node '{}' (#{})", to_string(type_), name_, id_);
        cached_result_ = std::make_shared<const Partitions<T>>(compute());
        cache_valid_ = true;
        return cached_result_;
    }

protected:
    virtual Partitions<T> compute() = 0;

private:
    Result cached_result_;
};

/**
 * Source node - in-memory elements split into contiguous partitions
 */
template<typename T>
class SourceNode : public DatasetNode<T> {
public:
    SourceNode(std::vector<T> elements, ExecutorOptions options, std::string name = "source")
        : DatasetNode<T>(OperationType::SOURCE, std::move(name), std::move(options))
        , elements_(std::move(elements)) {}

    size_t num_elements() const { return elements_.size(); }

protected:
    Partitions<T> compute() override {
        size_t num_partitions = this->options_.num_partitions;
        size_t total = elements_.size();

        Partitions<T> partitions(num_partitions);
        for (size_t p = 0; p < num_partitions; ++p) {
            size_t begin = p * total / num_partitions;
            size_t end = (p + 1) * total / num_partitions;
            partitions[p].assign(elements_.begin() + begin, elements_.begin() + end);
        }
        return partitions;
    }

private:
    std::vector<T> elements_;
};

// Input of a node as the typed node it was added as
template<typename T>
std::shared_ptr<DatasetNode<T>> typed_input(const Node& node, size_t index) {
    if (index >= node.inputs().size()) {
        throw std::runtime_error("Node '" + node.name() + "' requires at least " +
                                 std::to_string(index + 1) + " input(s)");
    }
    auto input = std::dynamic_pointer_cast<DatasetNode<T>>(node.inputs()[index]);
    if (!input) {
        throw std::runtime_error("Input " + std::to_string(index) + " of node '" + node.name() +
                                 "' has an unexpected element type");
    }
    return input;
}

} // namespace dag
} // namespace lazyagg
