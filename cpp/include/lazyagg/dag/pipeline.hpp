#pragma once

#include "executor_options.hpp"
#include "node.hpp"
#include <memory>
#include <string>
#include <vector>

namespace lazyagg {
namespace dag {

/**
 * Owner of one logical plan
 * Holds the executor options every node of the plan runs with and keeps
 * each node in creation order for plan inspection
 */
class Pipeline {
public:
    explicit Pipeline(ExecutorOptions options = ExecutorOptions(), std::string name = "pipeline");

    static std::shared_ptr<Pipeline> create(ExecutorOptions options = ExecutorOptions(),
                                            std::string name = "pipeline");

    const ExecutorOptions& options() const { return options_; }
    const std::string& name() const { return name_; }

    // Graph construction
    void add_node(std::shared_ptr<Node> node);
    std::shared_ptr<Node> get_node(size_t id) const;
    const std::vector<std::shared_ptr<Node>>& nodes() const { return nodes_; }

    // Analysis: every node comes after all of its inputs
    std::vector<std::shared_ptr<Node>> topological_sort() const;

    // Debugging
    std::string to_dot() const;
    void log_execution_plan() const;

private:
    ExecutorOptions options_;
    std::string name_;
    std::vector<std::shared_ptr<Node>> nodes_;
};

} // namespace dag
} // namespace lazyagg
