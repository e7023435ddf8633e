#pragma once

#include <utility>
#include <vector>

namespace lazyagg {

/**
 * Sink for the outputs of a DoFn
 */
template<typename T>
class Emitter {
public:
    virtual ~Emitter() = default;

    virtual void emit(T value) = 0;
};

/**
 * Emitter that buffers everything it is given, used by the in-memory executor
 */
template<typename T>
class VectorEmitter : public Emitter<T> {
public:
    void emit(T value) override { output_.push_back(std::move(value)); }

    const std::vector<T>& output() const { return output_; }
    std::vector<T> take() { return std::move(output_); }

private:
    std::vector<T> output_;
};

} // namespace lazyagg
