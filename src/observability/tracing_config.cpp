#include "tracelink/core/observability/tracing_config.hpp"

#include "tracelink/core/config/configuration.hpp"

namespace tracelink::core::observability {

TracingConfig TracingConfig::from_toml(const config::Configuration& config) {
    TracingConfig tracing;
    tracing.enabled = config.get_bool("tracing.enabled", tracing.enabled);
    tracing.service_name = config.get_string("tracing.service_name", tracing.service_name);
    if (config.contains("tracing.report_level")) {
        tracing.report_level = logging::level_from_string(config.get_string("tracing.report_level"));
    }
    tracing.register_global = config.get_bool("tracing.register_global", tracing.register_global);
    return tracing;
}

bool TracingConfig::validate() const {
    return !service_name.empty() && report_level != logging::Level::off;
}

}  // namespace tracelink::core::observability
