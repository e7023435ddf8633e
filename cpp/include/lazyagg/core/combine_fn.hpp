#pragma once

#include "do_fn.hpp"
#include "grouped_values.hpp"
#include <cstdint>
#include <functional>
#include <utility>

namespace lazyagg {

/**
 * Reduction over all values sharing a key.
 *
 * The executor may run a combiner zero or more times map-side, any number of
 * times at intermediate levels over arbitrary sub-groups of a key's values,
 * and once reduce-side. Implementations must therefore satisfy
 *
 *   combine(k, S1 ++ ... ++ Sn) == combine(k, combine(k, S1) ++ ... ++ combine(k, Sn))
 *
 * for every split of the values, emit only under the key they were given,
 * and have no side effects outside the emitter.
 */
template<typename K, typename V>
class CombineFn : public DoFn<Grouped<K, V>, std::pair<K, V>> {
public:
    using key_type = K;
    using value_type = V;
};

/**
 * Folds all values of a key with an associative, commutative binary operator.
 */
template<typename K, typename V, typename Op>
class BinaryCombineFn : public CombineFn<K, V> {
public:
    explicit BinaryCombineFn(Op op) : op_(std::move(op)) {}

    void process(const Grouped<K, V>& input, Emitter<std::pair<K, V>>& emitter) override {
        auto it = input.second.begin();
        auto end = input.second.end();
        if (it == end) {
            return;
        }

        V accumulated = detach(*it);
        for (++it; it != end; ++it) {
            accumulated = op_(std::move(accumulated), *it);
        }
        emitter.emit(std::make_pair(input.first, std::move(accumulated)));
    }

private:
    Op op_;
};

template<typename K, typename V, typename Op>
BinaryCombineFn<K, V, Op> binary_combine_fn(Op op) {
    return BinaryCombineFn<K, V, Op>(std::move(op));
}

template<typename K>
BinaryCombineFn<K, int64_t, std::plus<int64_t>> sum_longs() {
    return BinaryCombineFn<K, int64_t, std::plus<int64_t>>(std::plus<int64_t>());
}

} // namespace lazyagg
