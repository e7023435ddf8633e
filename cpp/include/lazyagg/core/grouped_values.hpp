#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace lazyagg {

/**
 * Copies a value out of an engine-owned buffer so it can outlive the
 * iteration step that produced it. Specialize for types whose copy
 * constructor does not produce an independent value.
 */
template<typename V>
struct Detach {
    V operator()(const V& value) const { return V(value); }
};

template<typename V>
V detach(const V& value) {
    return Detach<V>()(value);
}

/**
 * The values of one key after group_by_key.
 *
 * Iteration goes through a single reusable buffer shared by all iterators of
 * this object: the reference returned by operator* is overwritten by the next
 * increment (and by any other iterator of the same group). Anything that is
 * kept past the current step has to be detached first.
 */
template<typename V>
class GroupedValues {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = V;
        using difference_type = std::ptrdiff_t;
        using pointer = const V*;
        using reference = const V&;

        iterator() = default;

        iterator(const std::vector<V>* values, size_t position, std::shared_ptr<std::optional<V>> buffer)
            : values_(values), position_(position), buffer_(std::move(buffer)) {
            load();
        }

        reference operator*() const { return **buffer_; }
        pointer operator->() const { return &**buffer_; }

        iterator& operator++() {
            ++position_;
            load();
            return *this;
        }

        bool operator==(const iterator& other) const { return position_ == other.position_; }
        bool operator!=(const iterator& other) const { return position_ != other.position_; }

    private:
        void load() {
            if (values_ && position_ < values_->size()) {
                buffer_->emplace((*values_)[position_]);
            }
        }

        const std::vector<V>* values_ = nullptr;
        size_t position_ = 0;
        std::shared_ptr<std::optional<V>> buffer_;
    };

    GroupedValues() : GroupedValues(std::vector<V>{}) {}

    explicit GroupedValues(std::vector<V> values)
        : values_(std::make_shared<const std::vector<V>>(std::move(values)))
        , buffer_(std::make_shared<std::optional<V>>()) {}

    iterator begin() const { return iterator(values_.get(), 0, buffer_); }
    iterator end() const { return iterator(nullptr, values_->size(), buffer_); }

    size_t size() const { return values_->size(); }
    bool empty() const { return values_->empty(); }

private:
    std::shared_ptr<const std::vector<V>> values_;
    std::shared_ptr<std::optional<V>> buffer_;
};

template<typename K, typename V>
using Grouped = std::pair<K, GroupedValues<V>>;

} // namespace lazyagg
