#pragma once

#include <stdexcept>
#include <string>

namespace lazyagg {

// Readable form of a typeid name; the input is returned unchanged if it cannot be demangled
std::string demangle(const char* mangled_name);

/**
 * Raised while a pipeline is being built, before any node exists, when an
 * aggregation that needs a total order is given an element type without one.
 */
class UnsupportedTypeError : public std::invalid_argument {
public:
    UnsupportedTypeError(const std::string& operation, const std::string& type_name);

    const std::string& operation() const { return operation_; }
    const std::string& type_name() const { return type_name_; }

private:
    std::string operation_;
    std::string type_name_;
};

/**
 * Raised on scalar-result resolution when min/max/length ran over zero elements.
 */
class EmptyAggregationError : public std::runtime_error {
public:
    explicit EmptyAggregationError(const std::string& what_was_requested);

    const std::string& requested() const { return requested_; }

private:
    std::string requested_;
};

} // namespace lazyagg
