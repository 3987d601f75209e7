#pragma once

#include <memory>

#include "tracelink/core/span.hpp"

namespace tracelink::core {

/**
 * @brief Activation record binding a span to "current" status on one thread.
 *
 * Obtained from ScopeManager::activate and owned by the caller. Scopes must be
 * released in LIFO order; destroying a scope closes it.
 */
class Scope {
public:
    virtual ~Scope() = default;

    /**
     * @brief Ends the activation and restores the previously active scope.
     * Finishes the span if the scope was created with finish_on_close.
     * Has no effect when this scope is not the active one.
     */
    virtual void close() = 0;

    [[nodiscard]] virtual const SpanPtr& span() const noexcept = 0;
};

using ScopePtr = std::unique_ptr<Scope>;

class ScopeManager {
public:
    virtual ~ScopeManager() = default;

    [[nodiscard]] virtual ScopePtr activate(SpanPtr span, bool finish_on_close) = 0;

    // nullptr when nothing is active on the calling thread.
    [[nodiscard]] virtual Scope* active() const = 0;
};

}  // namespace tracelink::core
