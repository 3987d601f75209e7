#pragma once

#include <string>

#include "tracelink/core/logging/config.hpp"

namespace tracelink::core {
namespace config {
class Configuration;
}
}

namespace tracelink::core::observability {

struct TracingConfig {
    bool enabled{true};
    std::string service_name{"tracelink"};
    logging::Level report_level{logging::Level::info};

    // Install the tracer as the GlobalTracer when the module starts.
    bool register_global{true};

    // Reads the [tracing] section.
    static TracingConfig from_toml(const config::Configuration& config);

    [[nodiscard]] bool validate() const;
};

}  // namespace tracelink::core::observability
