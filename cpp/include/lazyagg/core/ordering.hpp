#pragma once

#include "errors.hpp"
#include <functional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace lazyagg {

template<typename T, typename = void>
struct is_less_comparable : std::false_type {};

template<typename T>
struct is_less_comparable<T, std::void_t<decltype(std::declval<const T&>() < std::declval<const T&>())>>
    : std::true_type {};

/**
 * Ordering capability for an element type.
 *
 * A default-constructed Ordering carries no comparison and describes a type
 * that cannot be ordered; aggregations that need a total order reject it
 * through require_total_order() before building any plan node.
 */
template<typename T>
class Ordering {
public:
    // Three-way comparison: negative, zero or positive
    using Compare = std::function<int(const T&, const T&)>;

    Ordering() = default;
    explicit Ordering(Compare compare) : compare_(std::move(compare)) {}

    bool is_total() const { return static_cast<bool>(compare_); }

    int compare(const T& left, const T& right) const { return compare_(left, right); }

    Ordering reversed() const {
        if (!is_total()) {
            return Ordering();
        }
        Compare forward = compare_;
        return Ordering([forward](const T& left, const T& right) { return forward(right, left); });
    }

private:
    Compare compare_;
};

/**
 * The ordering given by operator<, or an empty ordering for types without one.
 */
template<typename T>
Ordering<T> natural_order() {
    if constexpr (is_less_comparable<T>::value) {
        return Ordering<T>([](const T& left, const T& right) {
            if (left < right) return -1;
            if (right < left) return 1;
            return 0;
        });
    } else {
        return Ordering<T>();
    }
}

template<typename T>
std::string type_name() {
    return demangle(typeid(T).name());
}

template<typename T>
void require_total_order(const Ordering<T>& ordering, const std::string& operation) {
    if (!ordering.is_total()) {
        throw UnsupportedTypeError(operation, type_name<T>());
    }
}

/**
 * Ranks key-value pairs by value only. rank(a, b) < 0 means a is better
 * than b: larger values are better when maximizing, smaller ones otherwise.
 */
template<typename K, typename V>
class PairValueRank {
public:
    PairValueRank(Ordering<V> ordering, bool maximize)
        : ordering_(std::move(ordering)), maximize_(maximize) {}

    int operator()(const std::pair<K, V>& left, const std::pair<K, V>& right) const {
        // Only the sign of a comparison is meaningful
        int cmp = maximize_ ? ordering_.compare(right.second, left.second)
                            : ordering_.compare(left.second, right.second);
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }

private:
    Ordering<V> ordering_;
    bool maximize_;
};

} // namespace lazyagg
