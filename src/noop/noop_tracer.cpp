#include "tracelink/core/noop/noop_tracer.hpp"

namespace tracelink::core::noop {

const std::shared_ptr<const NoopSpanContext>& NoopSpanContext::instance() {
    static const std::shared_ptr<const NoopSpanContext> context = std::make_shared<const NoopSpanContext>();
    return context;
}

const std::shared_ptr<NoopSpan>& NoopSpan::instance() {
    static const std::shared_ptr<NoopSpan> span = std::make_shared<NoopSpan>();
    return span;
}

ScopePtr NoopScopeManager::activate(SpanPtr /*span*/, bool /*finish_on_close*/) {
    return std::make_unique<NoopScope>();
}

ScopePtr NoopSpanBuilder::start_active(bool /*finish_on_close*/) {
    return std::make_unique<NoopScope>();
}

SpanPtr NoopSpanBuilder::start() {
    return NoopSpan::instance();
}

SpanBuilderPtr NoopTracer::build_span(std::string_view /*operation_name*/) {
    return std::make_unique<NoopSpanBuilder>();
}

std::shared_ptr<NoopTracer> make_noop_tracer() {
    return std::make_shared<NoopTracer>();
}

}  // namespace tracelink::core::noop
