#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "tracelink/core/tracer.hpp"

namespace tracelink::core::util {

/**
 * @brief Process-wide fallback tracer for code that cannot be handed one explicitly.
 *
 * GlobalTracer::get() is a stable forwarding handle: every call is delegated to the
 * tracer registered at the time of the call. Until a registration happens that is a
 * no-op tracer. At most one tracer can ever be registered.
 */
class GlobalTracer final : public Tracer {
public:
    using Provider = std::function<TracerPtr()>;

    GlobalTracer(const GlobalTracer&) = delete;
    GlobalTracer& operator=(const GlobalTracer&) = delete;

    [[nodiscard]] static const std::shared_ptr<GlobalTracer>& get();

    // True once a tracer other than the no-op default is installed.
    [[nodiscard]] static bool is_registered();

    /**
     * @brief Installs the tracer returned by `provider` unless one is already registered.
     *
     * `provider` is only invoked when nothing is registered yet and must not call back
     * into registration. Exceptions derived from std::exception propagate unchanged,
     * anything else is rethrown as a nested std::runtime_error. Concurrent callers see
     * exactly one `true`.
     *
     * @return true if the provided tracer was installed by this call.
     * @throws std::invalid_argument if `provider` is empty or returns nullptr.
     */
    static bool register_if_absent(const Provider& provider);

    /**
     * @brief Registers `tracer`, tolerating re-registration of the same instance.
     * @throws IllegalState if a different tracer is already registered.
     */
    [[deprecated("use register_if_absent")]] static void register_tracer(const TracerPtr& tracer);

    ScopeManager& scope_manager() override;
    [[nodiscard]] SpanPtr active_span() override;
    [[nodiscard]] SpanBuilderPtr build_span(std::string_view operation_name) override;

    void inject(const SpanContext& context,
                propagation::Format<propagation::TextMap> format,
                propagation::TextMap& carrier) override;
    void inject(const SpanContext& context,
                propagation::Format<propagation::BinaryCarrier> format,
                propagation::BinaryCarrier& carrier) override;

    [[nodiscard]] SpanContextPtr extract(propagation::Format<propagation::TextMap> format,
                                         const propagation::TextMap& carrier) override;
    [[nodiscard]] SpanContextPtr extract(propagation::Format<propagation::BinaryCarrier> format,
                                         const propagation::BinaryCarrier& carrier) override;

    [[nodiscard]] std::string to_string() const override;

private:
    GlobalTracer() = default;
};

namespace testing {

// Puts the no-op default back. Only for test fixtures.
void reset_global_tracer();

}  // namespace testing

}  // namespace tracelink::core::util
