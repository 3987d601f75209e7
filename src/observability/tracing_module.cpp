#include "tracelink/core/observability/tracing_module.hpp"

#include <stdexcept>
#include <utility>

#include "tracelink/core/util/global_tracer.hpp"

namespace tracelink::core::observability {

TracingModule::TracingModule(logging::LoggerPtr logger) : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("TracingModule requires a logger");
    }
}

void TracingModule::configure(const config::Configuration& configuration) {
    if (started_) {
        throw std::runtime_error("Cannot reconfigure tracing after start");
    }

    auto tracing = TracingConfig::from_toml(configuration);
    if (!tracing.validate()) {
        throw std::invalid_argument("Invalid tracing configuration");
    }

    config_ = std::move(tracing);
    if (config_.enabled) {
        tracer_ = std::make_shared<LogTracer>(LogTracerOptions{config_.service_name, config_.report_level}, logger_);
        logger_->debug("[tracing] service {} reports spans at {}", config_.service_name,
                       logging::level_to_string(config_.report_level));
    } else {
        tracer_.reset();
        logger_->debug("[tracing] disabled");
    }
    configured_ = true;
}

void TracingModule::start() {
    if (started_) {
        return;
    }
    if (!configured_) {
        throw std::runtime_error("TracingModule started before configure()");
    }
    started_ = true;

    if (!tracer_ || !config_.register_global) {
        return;
    }

    registered_globally_ = util::GlobalTracer::register_if_absent([this] { return tracer_; });
    if (registered_globally_) {
        logger_->info("[tracing] {} installed as global tracer", tracer_->to_string());
    } else {
        logger_->warn("[tracing] global tracer already set to {}, keeping it",
                      util::GlobalTracer::get()->to_string());
    }
}

void TracingModule::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    // A registered global tracer stays installed for the rest of the process.
    logger_->info("[tracing] stopped");
}

}  // namespace tracelink::core::observability
