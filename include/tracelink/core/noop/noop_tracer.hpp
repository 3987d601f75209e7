#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "tracelink/core/tracer.hpp"

namespace tracelink::core::noop {

/**
 * @brief Inert implementations used before a real tracer is configured.
 *
 * Every operation is side-effect free and returns shared singletons or empty values.
 */
class NoopSpanContext final : public SpanContext {
public:
    void for_each_baggage_item(const BaggageVisitor& /*visitor*/) const override {}

    static const std::shared_ptr<const NoopSpanContext>& instance();
};

class NoopSpan final : public Span {
public:
    [[nodiscard]] SpanContextPtr context() const override { return NoopSpanContext::instance(); }

    void set_tag(const std::string& /*key*/, const Value& /*value*/) override {}

    void log(const LogFields& /*fields*/) override {}
    void log(SystemTime /*timestamp*/, const LogFields& /*fields*/) override {}
    void log(std::string_view /*event*/) override {}
    void log(SystemTime /*timestamp*/, std::string_view /*event*/) override {}

    void set_baggage_item(const std::string& /*key*/, const std::string& /*value*/) override {}
    [[nodiscard]] std::optional<std::string> baggage_item(const std::string& /*key*/) const override {
        return std::nullopt;
    }

    void set_operation_name(std::string_view /*name*/) override {}

    void finish() override {}
    void finish(SystemTime /*finish_time*/) override {}

    static const std::shared_ptr<NoopSpan>& instance();
};

class NoopScope final : public Scope {
public:
    void close() override {}
    [[nodiscard]] const SpanPtr& span() const noexcept override { return span_; }

private:
    SpanPtr span_{NoopSpan::instance()};
};

class NoopScopeManager final : public ScopeManager {
public:
    [[nodiscard]] ScopePtr activate(SpanPtr span, bool finish_on_close) override;
    [[nodiscard]] Scope* active() const override { return nullptr; }
};

class NoopSpanBuilder final : public SpanBuilder {
public:
    SpanBuilder& add_reference(ReferenceType /*type*/, SpanContextPtr /*referenced*/) override { return *this; }
    SpanBuilder& ignore_active_span() override { return *this; }
    SpanBuilder& with_tag(const std::string& /*key*/, const Value& /*value*/) override { return *this; }
    SpanBuilder& with_start_timestamp(SystemTime /*start_time*/) override { return *this; }

    [[nodiscard]] ScopePtr start_active(bool finish_on_close) override;
    [[nodiscard]] SpanPtr start() override;
};

class NoopTracer : public Tracer {
public:
    ScopeManager& scope_manager() override { return scope_manager_; }
    [[nodiscard]] SpanPtr active_span() override { return nullptr; }
    [[nodiscard]] SpanBuilderPtr build_span(std::string_view operation_name) override;

    void inject(const SpanContext& /*context*/,
                propagation::Format<propagation::TextMap> /*format*/,
                propagation::TextMap& /*carrier*/) override {}
    void inject(const SpanContext& /*context*/,
                propagation::Format<propagation::BinaryCarrier> /*format*/,
                propagation::BinaryCarrier& /*carrier*/) override {}

    [[nodiscard]] SpanContextPtr extract(propagation::Format<propagation::TextMap> /*format*/,
                                         const propagation::TextMap& /*carrier*/) override {
        return nullptr;
    }
    [[nodiscard]] SpanContextPtr extract(propagation::Format<propagation::BinaryCarrier> /*format*/,
                                         const propagation::BinaryCarrier& /*carrier*/) override {
        return nullptr;
    }

    [[nodiscard]] std::string to_string() const override { return "NoopTracer"; }

private:
    NoopScopeManager scope_manager_;
};

std::shared_ptr<NoopTracer> make_noop_tracer();

}  // namespace tracelink::core::noop
