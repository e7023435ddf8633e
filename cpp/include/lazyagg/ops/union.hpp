#pragma once

#include "../dag/node.hpp"
#include <string>
#include <utility>

namespace lazyagg {
namespace ops {

// Union operation - the partitions of every input, inputs in order
template<typename T>
class UnionNode : public dag::DatasetNode<T> {
public:
    UnionNode(dag::ExecutorOptions options, std::string name = "union")
        : dag::DatasetNode<T>(dag::OperationType::UNION, std::move(name), std::move(options)) {}

protected:
    dag::Partitions<T> compute() override {
        if (this->inputs_.empty()) {
            throw std::runtime_error("UnionNode requires at least one input");
        }

        dag::Partitions<T> output;
        for (size_t i = 0; i < this->inputs_.size(); ++i) {
            auto input = dag::typed_input<T>(*this, i)->execute();
            output.insert(output.end(), input->begin(), input->end());
        }
        return output;
    }
};

} // namespace ops
} // namespace lazyagg
