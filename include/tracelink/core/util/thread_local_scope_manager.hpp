#pragma once

#include "tracelink/core/scope.hpp"

namespace tracelink::core::util {

class ThreadLocalScopeManager;

/**
 * @brief Scope that remembers the scope it displaced and puts it back on close().
 *
 * The chain of displaced scopes is the per-thread activation stack.
 */
class ThreadLocalScope final : public Scope {
public:
    ThreadLocalScope(const ThreadLocalScopeManager& manager, SpanPtr wrapped, bool finish_on_close);
    ~ThreadLocalScope() override;

    ThreadLocalScope(const ThreadLocalScope&) = delete;
    ThreadLocalScope& operator=(const ThreadLocalScope&) = delete;
    ThreadLocalScope(ThreadLocalScope&&) = delete;
    ThreadLocalScope& operator=(ThreadLocalScope&&) = delete;

    void close() override;
    [[nodiscard]] const SpanPtr& span() const noexcept override { return wrapped_; }

    [[nodiscard]] bool finish_on_close() const noexcept { return finish_on_close_; }
    [[nodiscard]] ThreadLocalScope* previous() const noexcept { return to_restore_; }

private:
    const ThreadLocalScopeManager& manager_;
    SpanPtr wrapped_;
    bool finish_on_close_;
    ThreadLocalScope* to_restore_;
    bool closed_{false};
};

/**
 * @brief ScopeManager whose active scope is confined to the calling thread.
 *
 * Each manager instance has its own stack per thread. A new thread starts with
 * nothing active; handing a span to another thread means activating it there.
 * Scopes must be closed in reverse order of activation on the thread that
 * created them. Closing any other scope is ignored.
 */
class ThreadLocalScopeManager final : public ScopeManager {
public:
    ThreadLocalScopeManager() = default;
    ~ThreadLocalScopeManager() override;

    ThreadLocalScopeManager(const ThreadLocalScopeManager&) = delete;
    ThreadLocalScopeManager& operator=(const ThreadLocalScopeManager&) = delete;

    [[nodiscard]] ScopePtr activate(SpanPtr span, bool finish_on_close) override;
    [[nodiscard]] Scope* active() const override;

private:
    friend class ThreadLocalScope;

    [[nodiscard]] ThreadLocalScope* current() const;
    void make_current(ThreadLocalScope* scope) const;
};

}  // namespace tracelink::core::util
