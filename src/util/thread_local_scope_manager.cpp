#include "tracelink/core/util/thread_local_scope_manager.hpp"

#include <exception>
#include <unordered_map>
#include <utility>

#include "tracelink/core/logging/logger.hpp"

namespace tracelink::core::util {
namespace {

using ActiveScopes = std::unordered_map<const ThreadLocalScopeManager*, ThreadLocalScope*>;

// Top of the activation stack of every manager used on this thread.
ActiveScopes& active_scopes() {
    thread_local ActiveScopes scopes;
    return scopes;
}

}  // namespace

ThreadLocalScope::ThreadLocalScope(const ThreadLocalScopeManager& manager, SpanPtr wrapped, bool finish_on_close)
    : manager_(manager),
      wrapped_(std::move(wrapped)),
      finish_on_close_(finish_on_close),
      to_restore_(manager.current()) {
    manager_.make_current(this);
}

ThreadLocalScope::~ThreadLocalScope() {
    try {
        close();
    } catch (const std::exception& e) {
        logging::library_logger()->error("finishing span on scope release failed: {}", e.what());
    } catch (...) {
        logging::library_logger()->error("finishing span on scope release failed with a non-standard exception");
    }
}

void ThreadLocalScope::close() {
    if (manager_.current() != this) {
        if (!closed_) {
            logging::library_logger()->debug("ignoring out-of-order close of scope {}",
                                             static_cast<const void*>(this));
        }
        return;
    }
    closed_ = true;

    if (finish_on_close_ && wrapped_) {
        try {
            wrapped_->finish();
        } catch (...) {
            manager_.make_current(to_restore_);
            throw;
        }
    }
    manager_.make_current(to_restore_);
}

ThreadLocalScopeManager::~ThreadLocalScopeManager() {
    active_scopes().erase(this);
}

ScopePtr ThreadLocalScopeManager::activate(SpanPtr span, bool finish_on_close) {
    return std::make_unique<ThreadLocalScope>(*this, std::move(span), finish_on_close);
}

Scope* ThreadLocalScopeManager::active() const {
    return current();
}

ThreadLocalScope* ThreadLocalScopeManager::current() const {
    auto& scopes = active_scopes();
    auto it = scopes.find(this);
    return it == scopes.end() ? nullptr : it->second;
}

void ThreadLocalScopeManager::make_current(ThreadLocalScope* scope) const {
    auto& scopes = active_scopes();
    if (scope == nullptr) {
        scopes.erase(this);
    } else {
        scopes[this] = scope;
    }
}

}  // namespace tracelink::core::util
