#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "tracelink/core/propagation/format.hpp"
#include "tracelink/core/propagation/text_map.hpp"
#include "tracelink/core/scope.hpp"
#include "tracelink/core/span.hpp"

namespace tracelink::core {

enum class ReferenceType {
    child_of,
    follows_from
};

std::string_view to_string(ReferenceType type) noexcept;

/**
 * @brief Fluent construction of a new span.
 *
 * Unless ignore_active_span() is called or an explicit reference is added, the
 * tracer's active span becomes the implicit child_of parent.
 */
class SpanBuilder {
public:
    virtual ~SpanBuilder() = default;

    // A null parent is ignored.
    SpanBuilder& as_child_of(SpanContextPtr parent) {
        return add_reference(ReferenceType::child_of, std::move(parent));
    }
    SpanBuilder& as_child_of(const SpanPtr& parent) {
        return as_child_of(parent ? parent->context() : SpanContextPtr{});
    }

    virtual SpanBuilder& add_reference(ReferenceType type, SpanContextPtr referenced) = 0;
    virtual SpanBuilder& ignore_active_span() = 0;
    virtual SpanBuilder& with_tag(const std::string& key, const Value& value) = 0;
    virtual SpanBuilder& with_start_timestamp(SystemTime start_time) = 0;

    // Starts the span and activates it on the tracer's scope manager.
    [[nodiscard]] virtual ScopePtr start_active(bool finish_on_close) = 0;
    [[nodiscard]] virtual SpanPtr start() = 0;
};

using SpanBuilderPtr = std::unique_ptr<SpanBuilder>;

class Tracer {
public:
    virtual ~Tracer() = default;

    virtual ScopeManager& scope_manager() = 0;

    // Span of the active scope, nullptr when nothing is active.
    [[nodiscard]] virtual SpanPtr active_span() = 0;

    [[nodiscard]] virtual SpanBuilderPtr build_span(std::string_view operation_name) = 0;

    virtual void inject(const SpanContext& context,
                        propagation::Format<propagation::TextMap> format,
                        propagation::TextMap& carrier) = 0;
    virtual void inject(const SpanContext& context,
                        propagation::Format<propagation::BinaryCarrier> format,
                        propagation::BinaryCarrier& carrier) = 0;

    /**
     * @return nullptr when the carrier holds no context.
     * @throws std::invalid_argument when the carrier holds a corrupt context.
     */
    [[nodiscard]] virtual SpanContextPtr extract(propagation::Format<propagation::TextMap> format,
                                                 const propagation::TextMap& carrier) = 0;
    [[nodiscard]] virtual SpanContextPtr extract(propagation::Format<propagation::BinaryCarrier> format,
                                                 const propagation::BinaryCarrier& carrier) = 0;

    [[nodiscard]] virtual std::string to_string() const { return "Tracer"; }
};

using TracerPtr = std::shared_ptr<Tracer>;

}  // namespace tracelink::core
