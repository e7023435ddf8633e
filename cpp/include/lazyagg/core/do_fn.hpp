#pragma once

#include "emitter.hpp"
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace lazyagg {

/**
 * Element transform applied by parallel_do.
 *
 * For every partition the executor works on a fresh copy of the prototype
 * that was handed to parallel_do and calls initialize() once, process() for
 * each element of the partition and cleanup() once at the end. Members of a
 * DoFn are therefore partition-scoped state: they are never shared between
 * partitions and never touched concurrently.
 */
template<typename S, typename T>
class DoFn {
public:
    using input_type = S;
    using output_type = T;

    virtual ~DoFn() = default;

    virtual void initialize() {}
    virtual void process(const S& input, Emitter<T>& emitter) = 0;
    virtual void cleanup(Emitter<T>& emitter) {}
};

// One output per input
template<typename S, typename T>
class MapFn : public DoFn<S, T> {
public:
    virtual T map(const S& input) = 0;

    void process(const S& input, Emitter<T>& emitter) override {
        emitter.emit(map(input));
    }
};

// Zero or one output per input, unchanged
template<typename S>
class FilterFn : public DoFn<S, S> {
public:
    virtual bool accept(const S& input) = 0;

    void process(const S& input, Emitter<S>& emitter) override {
        if (accept(input)) {
            emitter.emit(input);
        }
    }
};

template<typename S, typename T, typename F>
class LambdaMapFn : public MapFn<S, T> {
public:
    explicit LambdaMapFn(F func) : func_(std::move(func)) {}

    T map(const S& input) override { return func_(input); }

private:
    F func_;
};

template<typename S, typename F>
class LambdaFilterFn : public FilterFn<S> {
public:
    explicit LambdaFilterFn(F predicate) : predicate_(std::move(predicate)) {}

    bool accept(const S& input) override { return predicate_(input); }

private:
    F predicate_;
};

// Stateless process-only transform: func(input, emitter)
template<typename S, typename T, typename F>
class LambdaDoFn : public DoFn<S, T> {
public:
    explicit LambdaDoFn(F func) : func_(std::move(func)) {}

    void process(const S& input, Emitter<T>& emitter) override { func_(input, emitter); }

private:
    F func_;
};

template<typename S, typename T>
using DoFnFactory = std::function<std::unique_ptr<DoFn<S, T>>()>;

/**
 * Turns a DoFn prototype into a factory that hands out one fresh copy per
 * evaluation context (partition or combine invocation).
 */
template<typename Fn>
DoFnFactory<typename Fn::input_type, typename Fn::output_type> prototype_factory(Fn prototype) {
    using Base = DoFn<typename Fn::input_type, typename Fn::output_type>;
    static_assert(std::is_base_of<Base, Fn>::value, "prototype must derive from DoFn");
    static_assert(std::is_copy_constructible<Fn>::value, "prototype must be copyable");

    return [prototype = std::move(prototype)]() -> std::unique_ptr<Base> {
        return std::make_unique<Fn>(prototype);
    };
}

template<typename S, typename T, typename F>
LambdaMapFn<S, T, std::decay_t<F>> map_fn(F&& func) {
    return LambdaMapFn<S, T, std::decay_t<F>>(std::forward<F>(func));
}

template<typename S, typename F>
LambdaFilterFn<S, std::decay_t<F>> filter_fn(F&& predicate) {
    return LambdaFilterFn<S, std::decay_t<F>>(std::forward<F>(predicate));
}

template<typename S, typename T, typename F>
LambdaDoFn<S, T, std::decay_t<F>> do_fn(F&& func) {
    return LambdaDoFn<S, T, std::decay_t<F>>(std::forward<F>(func));
}

} // namespace lazyagg
