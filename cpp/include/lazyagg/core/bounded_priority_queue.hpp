#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <stdexcept>
#include <utility>
#include <vector>

namespace lazyagg {

/**
 * Keeps the best `limit` values offered to it.
 *
 * The heap is ordered worst-on-top so that eviction after an insert is
 * O(log limit). Ranking comes from a three-way comparator where rank(a, b) < 0
 * means a is better. Values of equal rank are ordered by arrival: the one
 * offered earlier ranks higher, so results do not depend on heap layout.
 */
template<typename T>
class BoundedPriorityQueue {
public:
    using Rank = std::function<int(const T&, const T&)>;

    BoundedPriorityQueue(size_t limit, Rank rank)
        : limit_(limit), heap_(WorstOnTop{std::move(rank)}) {
        if (limit_ == 0) {
            throw std::invalid_argument("BoundedPriorityQueue limit must be positive");
        }
    }

    // Inserts, then evicts the worst survivor if the queue grew past its limit
    void offer(T value) {
        heap_.push(Entry{std::move(value), next_sequence_++});
        if (heap_.size() > limit_) {
            heap_.pop();
        }
    }

    const T& worst() const { return heap_.top().value; }

    size_t size() const { return heap_.size(); }
    bool empty() const { return heap_.empty(); }
    size_t limit() const { return limit_; }

    /**
     * Empties the queue and returns its contents best first.
     */
    std::vector<T> drain_ranked() {
        std::vector<T> ranked;
        ranked.reserve(heap_.size());
        while (!heap_.empty()) {
            ranked.push_back(heap_.top().value);
            heap_.pop();
        }
        std::reverse(ranked.begin(), ranked.end());
        return ranked;
    }

private:
    struct Entry {
        T value;
        uint64_t sequence;
    };

    // "Less" for std::priority_queue means "better", which puts the worst on top
    struct WorstOnTop {
        Rank rank;

        bool operator()(const Entry& left, const Entry& right) const {
            int cmp = rank(left.value, right.value);
            if (cmp != 0) {
                return cmp < 0;
            }
            return left.sequence < right.sequence;
        }
    };

    size_t limit_;
    uint64_t next_sequence_ = 0;
    std::priority_queue<Entry, std::vector<Entry>, WorstOnTop> heap_;
};

} // namespace lazyagg
