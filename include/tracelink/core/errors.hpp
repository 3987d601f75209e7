#pragma once

#include <stdexcept>
#include <string>

namespace tracelink::core {

/**
 * @brief Raised when an object is asked to do something its contract forbids,
 * e.g. writing through a carrier that only supports extraction.
 */
class UnsupportedOperation : public std::logic_error {
public:
    explicit UnsupportedOperation(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief Raised when a call conflicts with state that was already established,
 * e.g. a second, different global tracer registration.
 */
class IllegalState : public std::logic_error {
public:
    explicit IllegalState(const std::string& what) : std::logic_error(what) {}
};

}  // namespace tracelink::core
