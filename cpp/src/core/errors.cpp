#include "lazyagg/core/errors.hpp"

#include <cstdlib>
#include <cxxabi.h>
#include <memory>

namespace lazyagg {

std::string demangle(const char* mangled_name) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status),
                                                     &std::free);
    if (status != 0 || !demangled) {
        return mangled_name;
    }
    return demangled.get();
}

UnsupportedTypeError::UnsupportedTypeError(const std::string& operation, const std::string& type_name)
    : std::invalid_argument(
          "Can only compute " + operation + " for totally ordered elements, not for: " + type_name)
    , operation_(operation)
    , type_name_(type_name) {}

EmptyAggregationError::EmptyAggregationError(const std::string& what_was_requested)
    : std::runtime_error("No value for '" + what_was_requested + "': the aggregated collection is empty")
    , requested_(what_was_requested) {}

} // namespace lazyagg
