#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace lazyagg {

/**
 * Deferred scalar result of a pipeline.
 *
 * The loader runs synchronously on the first get(); its value is cached and
 * shared by every copy of this PObject. A loader that throws leaves the
 * object unresolved, so a later get() runs it again.
 */
template<typename T>
class PObject {
public:
    using Loader = std::function<T()>;

    PObject(Loader loader, std::string description)
        : state_(std::make_shared<State>(State{std::move(loader), std::nullopt}))
        , description_(std::move(description)) {}

    const T& get() const {
        if (!state_->value) {
            state_->value.emplace(state_->loader());
        }
        return *state_->value;
    }

    bool is_resolved() const { return state_->value.has_value(); }
    const std::string& description() const { return description_; }

private:
    struct State {
        Loader loader;
        std::optional<T> value;
    };

    std::shared_ptr<State> state_;
    std::string description_;
};

} // namespace lazyagg
