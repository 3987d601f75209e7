#pragma once

#include <memory>
#include <string_view>

#include "tracelink/core/logging/logger.hpp"
#include "tracelink/core/module.hpp"
#include "tracelink/core/observability/log_tracer.hpp"
#include "tracelink/core/observability/tracing_config.hpp"

namespace tracelink::core::observability {

/**
 * @brief Builds a LogTracer from the [tracing] section and, if asked to,
 * offers it to the GlobalTracer on start.
 */
class TracingModule : public Module {
public:
    explicit TracingModule(logging::LoggerPtr logger = logging::library_logger());

    std::string_view name() const noexcept override { return "tracing"; }
    void configure(const config::Configuration& configuration) override;
    void start() override;
    void stop() override;

    [[nodiscard]] const TracingConfig& tracing_config() const noexcept { return config_; }

    // nullptr until configured, and when tracing is disabled.
    [[nodiscard]] std::shared_ptr<LogTracer> tracer() const noexcept { return tracer_; }

    // Whether start() installed this module's tracer globally.
    [[nodiscard]] bool registered_globally() const noexcept { return registered_globally_; }

private:
    logging::LoggerPtr logger_;
    TracingConfig config_{};
    std::shared_ptr<LogTracer> tracer_;
    bool configured_{false};
    bool started_{false};
    bool registered_globally_{false};
};

}  // namespace tracelink::core::observability
