#include "lazyagg/dag/node.hpp"
#include <atomic>

namespace lazyagg {
namespace dag {

namespace {
std::atomic<size_t> next_node_id{0};
}

std::string to_string(OperationType type) {
    switch (type) {
        case OperationType::SOURCE: return "SOURCE";
        case OperationType::PARALLEL_DO: return "PARALLEL_DO";
        case OperationType::GROUP_BY_KEY: return "GROUP_BY_KEY";
        case OperationType::COMBINE_VALUES: return "COMBINE_VALUES";
        case OperationType::UNION: return "UNION";
    }
    return "UNKNOWN";
}

Node::Node(OperationType type, std::string name, ExecutorOptions options)
    : type_(type)
    , id_(next_node_id++)
    , name_(std::move(name))
    , options_(std::move(options)) {
    options_.validate();
    if (name_.empty()) {
        name_ = "node_" + std::to_string(id_);
    }
}

void Node::add_input(std::shared_ptr<Node> input) {
    if (!input) {
        throw std::invalid_argument("Cannot add null input to node '" + name_ + "'");
    }
    inputs_.push_back(std::move(input));
    cache_valid_ = false;
}

} // namespace dag
} // namespace lazyagg
