#include "tracelink/core/util/global_tracer.hpp"

#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>

#include "tracelink/core/errors.hpp"
#include "tracelink/core/logging/logger.hpp"
#include "tracelink/core/noop/noop_tracer.hpp"

namespace tracelink::core::util {
namespace {

struct Registry {
    // Kept alive for the whole process so references handed out before
    // registration (e.g. its scope manager) stay valid.
    const TracerPtr default_tracer{noop::make_noop_tracer()};

    // Read with std::atomic_load, written under write_mutex with std::atomic_store.
    TracerPtr tracer{default_tracer};
    std::mutex write_mutex;
};

Registry& registry() {
    static Registry instance;
    return instance;
}

TracerPtr current() {
    return std::atomic_load(&registry().tracer);
}

bool is_noop(const TracerPtr& tracer) {
    return dynamic_cast<const noop::NoopTracer*>(tracer.get()) != nullptr;
}

}  // namespace

const std::shared_ptr<GlobalTracer>& GlobalTracer::get() {
    // make_shared cannot reach the private constructor
    static const std::shared_ptr<GlobalTracer> instance{new GlobalTracer()};
    return instance;
}

bool GlobalTracer::is_registered() {
    return !is_noop(current());
}

bool GlobalTracer::register_if_absent(const Provider& provider) {
    if (!provider) {
        throw std::invalid_argument("Cannot register GlobalTracer from provider <null>.");
    }

    auto& state = registry();
    std::lock_guard lock{state.write_mutex};
    if (is_registered()) {
        return false;
    }

    TracerPtr supplied;
    try {
        supplied = provider();
    } catch (const std::exception&) {
        throw;
    } catch (...) {
        std::throw_with_nested(std::runtime_error("Exception obtaining tracer from provider"));
    }

    if (!supplied) {
        throw std::invalid_argument("Cannot register GlobalTracer <null>.");
    }
    if (supplied.get() == get().get()) {
        return false;
    }

    std::atomic_store(&state.tracer, supplied);
    logging::library_logger()->info("registered global tracer {}", supplied->to_string());
    return true;
}

void GlobalTracer::register_tracer(const TracerPtr& tracer) {
    if (!tracer) {
        throw std::invalid_argument("Cannot register GlobalTracer <null>.");
    }
    bool installed = register_if_absent([&tracer] { return tracer; });
    if (!installed && tracer != current() && tracer.get() != get().get()) {
        logging::library_logger()->warn("rejected registration of {}, {} is already registered",
                                        tracer->to_string(), current()->to_string());
        throw IllegalState("There is already a current global Tracer registered.");
    }
}

ScopeManager& GlobalTracer::scope_manager() {
    return current()->scope_manager();
}

SpanPtr GlobalTracer::active_span() {
    return current()->active_span();
}

SpanBuilderPtr GlobalTracer::build_span(std::string_view operation_name) {
    return current()->build_span(operation_name);
}

void GlobalTracer::inject(const SpanContext& context,
                          propagation::Format<propagation::TextMap> format,
                          propagation::TextMap& carrier) {
    current()->inject(context, format, carrier);
}

void GlobalTracer::inject(const SpanContext& context,
                          propagation::Format<propagation::BinaryCarrier> format,
                          propagation::BinaryCarrier& carrier) {
    current()->inject(context, format, carrier);
}

SpanContextPtr GlobalTracer::extract(propagation::Format<propagation::TextMap> format,
                                     const propagation::TextMap& carrier) {
    return current()->extract(format, carrier);
}

SpanContextPtr GlobalTracer::extract(propagation::Format<propagation::BinaryCarrier> format,
                                     const propagation::BinaryCarrier& carrier) {
    return current()->extract(format, carrier);
}

std::string GlobalTracer::to_string() const {
    return "GlobalTracer{" + current()->to_string() + "}";
}

namespace testing {

void reset_global_tracer() {
    auto& state = registry();
    std::lock_guard lock{state.write_mutex};
    std::atomic_store(&state.tracer, state.default_tracer);
}

}  // namespace testing

}  // namespace tracelink::core::util
