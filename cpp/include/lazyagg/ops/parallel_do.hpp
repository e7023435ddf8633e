#pragma once

#include "../core/do_fn.hpp"
#include "../core/emitter.hpp"
#include "../dag/node.hpp"
#include <string>
#include <utility>

namespace lazyagg {
namespace ops {

/**
 * ParallelDo operation - runs a DoFn over every partition of its input
 * Each partition gets its own DoFn instance from the factory and sees the
 * full initialize / process / cleanup lifecycle
 */
template<typename S, typename T>
class ParallelDoNode : public dag::DatasetNode<T> {
public:
    ParallelDoNode(DoFnFactory<S, T> factory, dag::ExecutorOptions options, std::string name = "parallel_do")
        : dag::DatasetNode<T>(dag::OperationType::PARALLEL_DO, std::move(name), std::move(options))
        , factory_(std::move(factory)) {}

protected:
    dag::Partitions<T> compute() override {
        auto input = dag::typed_input<S>(*this, 0)->execute();

        dag::Partitions<T> output;
        output.reserve(input->size());

        for (const auto& partition : *input) {
            auto fn = factory_();
            VectorEmitter<T> emitter;

            fn->initialize();
            for (const auto& element : partition) {
                fn->process(element, emitter);
            }
            fn->cleanup(emitter);

            output.push_back(emitter.take());
        }

        return output;
    }

private:
    DoFnFactory<S, T> factory_;
};

} // namespace ops
} // namespace lazyagg
