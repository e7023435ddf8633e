#pragma once

#include "../core/combine_fn.hpp"
#include "../core/do_fn.hpp"
#include "../core/ordering.hpp"
#include <optional>
#include <utility>

namespace lazyagg {
namespace aggregate {

/**
 * Running maximum (or minimum) under an ordering. The first of several
 * equal extrema is kept.
 */
template<typename S>
class ExtremumAccumulator {
public:
    ExtremumAccumulator(Ordering<S> ordering, bool maximize)
        : ordering_(std::move(ordering)), maximize_(maximize) {}

    void reset() { current_.reset(); }

    void accumulate(const S& candidate) {
        if (!current_ || improves(candidate)) {
            current_.emplace(detach(candidate));
        }
    }

    bool has_value() const { return current_.has_value(); }
    const S& value() const { return *current_; }

private:
    bool improves(const S& candidate) const {
        int cmp = ordering_.compare(*current_, candidate);
        return maximize_ ? cmp < 0 : cmp > 0;
    }

    Ordering<S> ordering_;
    bool maximize_;
    std::optional<S> current_;
};

/**
 * Partition-local fold: emits the partition's extremum, if it has one,
 * under the group key in cleanup()
 */
template<typename S>
class ExtremumFn : public DoFn<S, std::pair<bool, S>> {
public:
    ExtremumFn(Ordering<S> ordering, bool maximize, bool group_key)
        : accumulator_(std::move(ordering), maximize), group_key_(group_key) {}

    void initialize() override { accumulator_.reset(); }

    void process(const S& input, Emitter<std::pair<bool, S>>&) override {
        accumulator_.accumulate(input);
    }

    void cleanup(Emitter<std::pair<bool, S>>& emitter) override {
        if (accumulator_.has_value()) {
            emitter.emit(std::make_pair(group_key_, accumulator_.value()));
        }
    }

private:
    ExtremumAccumulator<S> accumulator_;
    bool group_key_;
};

// Re-folds partition extrema with the same accumulator
template<typename S>
class ExtremumCombineFn : public CombineFn<bool, S> {
public:
    ExtremumCombineFn(Ordering<S> ordering, bool maximize)
        : ordering_(std::move(ordering)), maximize_(maximize) {}

    void process(const Grouped<bool, S>& input, Emitter<std::pair<bool, S>>& emitter) override {
        ExtremumAccumulator<S> accumulator(ordering_, maximize_);
        for (const auto& candidate : input.second) {
            accumulator.accumulate(candidate);
        }
        if (accumulator.has_value()) {
            emitter.emit(std::make_pair(input.first, accumulator.value()));
        }
    }

private:
    Ordering<S> ordering_;
    bool maximize_;
};

} // namespace aggregate
} // namespace lazyagg
