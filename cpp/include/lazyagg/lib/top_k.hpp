#pragma once

#include "../core/bounded_priority_queue.hpp"
#include "../core/combine_fn.hpp"
#include "../core/do_fn.hpp"
#include "../core/ordering.hpp"
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lazyagg {
namespace aggregate {

/**
 * Local bound of top-K.
 *
 * Keeps one bounded queue per combiner staging key for the current partition
 * and emits the survivors of each queue, best first, as
 * (staging key, (key, value)) in cleanup(). The staging key decides how
 * candidates are grouped for the combine stage: the original key for a
 * per-key top-K, a constant for a global one.
 */
template<typename SK, typename K, typename V>
class TopKFn : public DoFn<std::pair<K, V>, std::pair<SK, std::pair<K, V>>> {
public:
    using Candidate = std::pair<K, V>;
    using StagingKeyFn = std::function<SK(const K&)>;

    TopKFn(size_t limit, PairValueRank<K, V> rank, StagingKeyFn staging_key)
        : limit_(limit), rank_(std::move(rank)), staging_key_(std::move(staging_key)) {}

    void initialize() override {
        index_.clear();
        queues_.clear();
    }

    void process(const Candidate& input, Emitter<std::pair<SK, Candidate>>&) override {
        SK staged = staging_key_(input.first);

        auto it = index_.find(staged);
        if (it == index_.end()) {
            it = index_.emplace(staged, queues_.size()).first;
            queues_.emplace_back(staged, BoundedPriorityQueue<Candidate>(limit_, rank_));
        }
        queues_[it->second].second.offer(input);
    }

    void cleanup(Emitter<std::pair<SK, Candidate>>& emitter) override {
        for (auto& entry : queues_) {
            for (auto& candidate : entry.second.drain_ranked()) {
                emitter.emit(std::make_pair(entry.first, std::move(candidate)));
            }
        }
        index_.clear();
        queues_.clear();
    }

private:
    size_t limit_;
    PairValueRank<K, V> rank_;
    StagingKeyFn staging_key_;

    std::unordered_map<SK, size_t> index_;
    std::vector<std::pair<SK, BoundedPriorityQueue<Candidate>>> queues_;
};

/**
 * Combine stage of top-K: rebuilds a bounded queue from every survivor
 * delivered for one staging key and emits what is left, best first. The same
 * rule at every level means any number of combine passes keeps the true top
 * `limit` candidates.
 */
template<typename SK, typename K, typename V>
class TopKCombineFn : public CombineFn<SK, std::pair<K, V>> {
public:
    using Candidate = std::pair<K, V>;

    TopKCombineFn(size_t limit, PairValueRank<K, V> rank)
        : limit_(limit), rank_(std::move(rank)) {}

    void process(const Grouped<SK, Candidate>& input, Emitter<std::pair<SK, Candidate>>& emitter) override {
        BoundedPriorityQueue<Candidate> queue(limit_, rank_);
        for (const auto& candidate : input.second) {
            queue.offer(detach(candidate));
        }

        for (auto& survivor : queue.drain_ranked()) {
            emitter.emit(std::make_pair(input.first, std::move(survivor)));
        }
    }

private:
    size_t limit_;
    PairValueRank<K, V> rank_;
};

// Drops the staging key
template<typename SK, typename K, typename V>
class UnstageFn : public MapFn<std::pair<SK, std::pair<K, V>>, std::pair<K, V>> {
public:
    std::pair<K, V> map(const std::pair<SK, std::pair<K, V>>& input) override { return input.second; }
};

} // namespace aggregate
} // namespace lazyagg
