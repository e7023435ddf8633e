#include "lazyagg/dag/pipeline.hpp"
#include <queue>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace lazyagg {
namespace dag {

Pipeline::Pipeline(ExecutorOptions options, std::string name)
    : options_(std::move(options)), name_(std::move(name)) {
    options_.validate();
    LAZYAGG_DEBUG("Created pipeline '{}' with {}", name_, options_.to_string());
}

std::shared_ptr<Pipeline> Pipeline::create(ExecutorOptions options, std::string name) {
    return std::make_shared<Pipeline>(std::move(options), std::move(name));
}

void Pipeline::add_node(std::shared_ptr<Node> node) {
    if (!node) {
        throw std::invalid_argument("Cannot add null node to pipeline");
    }

    for (const auto& existing : nodes_) {
        if (existing->id() == node->id()) {
            throw std::invalid_argument("Node '" + node->name() + "' already belongs to pipeline '" + name_ + "'");
        }
    }

    nodes_.push_back(std::move(node));
}

std::shared_ptr<Node> Pipeline::get_node(size_t id) const {
    for (const auto& node : nodes_) {
        if (node->id() == id) {
            return node;
        }
    }
    throw std::invalid_argument("Node #" + std::to_string(id) + " not found in pipeline '" + name_ + "'");
}

std::vector<std::shared_ptr<Node>> Pipeline::topological_sort() const {
    // Count unprocessed inputs per node, inputs outside this pipeline do not count
    std::unordered_map<const Node*, size_t> pending_inputs;
    std::unordered_map<const Node*, std::vector<std::shared_ptr<Node>>> consumers;
    for (const auto& node : nodes_) {
        pending_inputs[node.get()] = 0;
    }

    for (const auto& node : nodes_) {
        for (const auto& input : node->inputs()) {
            if (pending_inputs.count(input.get()) == 0) {
                continue;
            }
            pending_inputs[node.get()]++;
            consumers[input.get()].push_back(node);
        }
    }

    // Kahn's algorithm
    std::queue<std::shared_ptr<Node>> ready;
    for (const auto& node : nodes_) {
        if (pending_inputs[node.get()] == 0) {
            ready.push(node);
        }
    }

    std::vector<std::shared_ptr<Node>> sorted;
    while (!ready.empty()) {
        auto node = ready.front();
        ready.pop();
        sorted.push_back(node);

        for (const auto& consumer : consumers[node.get()]) {
            if (--pending_inputs[consumer.get()] == 0) {
                ready.push(consumer);
            }
        }
    }

    if (sorted.size() != nodes_.size()) {
        throw std::runtime_error("Pipeline '" + name_ + "' contains cycles");
    }

    return sorted;
}

std::string Pipeline::to_dot() const {
    std::ostringstream oss;
    oss << "digraph \"" << name_ << "\" {\n";
    oss << "  rankdir=TB;\n";
    oss << "  node [shape=box];\n";

    for (const auto& node : nodes_) {
        oss << "  n" << node->id() << " [label=\"" << node->name() << "\\n"
            << to_string(node->type()) << "\"];\n";

        for (const auto& input : node->inputs()) {
            oss << "  n" << input->id() << " -> n" << node->id() << ";\n";
        }
    }

    oss << "}\n";
    return oss.str();
}

void Pipeline::log_execution_plan() const {
    auto sorted = topological_sort();

    LAZYAGG_INFO("Execution plan of '{}' ({} nodes, {})", name_, sorted.size(), options_.to_string());

    for (size_t i = 0; i < sorted.size(); ++i) {
        const auto& node = sorted[i];

        std::ostringstream inputs;
        for (const auto& input : node->inputs()) {
            inputs << " #" << input->id();
        }

        LAZYAGG_INFO("{}. #{} {} [{}]{}{}{}",
                     i + 1,
                     node->id(),
                     node->name(),
                     to_string(node->type()),
                     node->inputs().empty() ? "" : " <-",
                     inputs.str(),
                     node->is_materialized() ? " (materialized)" : "");
    }
}

} // namespace dag
} // namespace lazyagg
