#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tracelink/core/logging/logger.hpp"
#include "tracelink/core/tracer.hpp"
#include "tracelink/core/util/thread_local_scope_manager.hpp"

namespace tracelink::core::observability {

/**
 * @brief Trace identity plus baggage. Immutable; baggage changes produce a new context.
 */
class LogSpanContext final : public SpanContext {
public:
    using Baggage = std::unordered_map<std::string, std::string>;

    LogSpanContext(std::uint64_t trace_id, std::uint64_t span_id, Baggage baggage = {});

    void for_each_baggage_item(const BaggageVisitor& visitor) const override;

    [[nodiscard]] std::uint64_t trace_id() const noexcept { return trace_id_; }
    [[nodiscard]] std::uint64_t span_id() const noexcept { return span_id_; }
    [[nodiscard]] const Baggage& baggage() const noexcept { return baggage_; }
    [[nodiscard]] std::optional<std::string> baggage_item(const std::string& key) const;

    [[nodiscard]] std::shared_ptr<const LogSpanContext> with_baggage_item(const std::string& key,
                                                                          const std::string& value) const;

private:
    std::uint64_t trace_id_;
    std::uint64_t span_id_;
    Baggage baggage_;
};

struct SpanReference {
    ReferenceType type;
    SpanContextPtr context;
};

/**
 * @brief Span that reports itself to a logger when finished.
 */
class LogSpan final : public Span {
public:
    struct LogRecord {
        SystemTime timestamp;
        LogFields fields;
    };

    LogSpan(logging::LoggerPtr logger,
            logging::Level report_level,
            std::string service_name,
            std::string operation_name,
            std::shared_ptr<const LogSpanContext> context,
            std::uint64_t parent_id,
            std::vector<SpanReference> references,
            std::vector<std::pair<std::string, Value>> tags,
            SystemTime start_time);

    [[nodiscard]] SpanContextPtr context() const override;

    void set_tag(const std::string& key, const Value& value) override;

    void log(const LogFields& fields) override;
    void log(SystemTime timestamp, const LogFields& fields) override;
    void log(std::string_view event) override;
    void log(SystemTime timestamp, std::string_view event) override;

    void set_baggage_item(const std::string& key, const std::string& value) override;
    [[nodiscard]] std::optional<std::string> baggage_item(const std::string& key) const override;

    void set_operation_name(std::string_view name) override;

    void finish() override;
    void finish(SystemTime finish_time) override;

    [[nodiscard]] std::string operation_name() const;
    [[nodiscard]] std::uint64_t parent_id() const noexcept { return parent_id_; }
    [[nodiscard]] const std::vector<SpanReference>& references() const noexcept { return references_; }
    [[nodiscard]] SystemTime start_time() const noexcept { return start_time_; }
    [[nodiscard]] std::optional<SystemTime> finish_time() const;
    [[nodiscard]] bool finished() const;
    [[nodiscard]] std::optional<Value> tag(const std::string& key) const;
    [[nodiscard]] std::vector<LogRecord> logs() const;

private:
    [[nodiscard]] std::shared_ptr<const LogSpanContext> log_context() const;
    void report(SystemTime finish_time, const std::string& summary) const;

    const logging::LoggerPtr logger_;
    const logging::Level report_level_;
    const std::string service_name_;
    const std::uint64_t parent_id_;
    const std::vector<SpanReference> references_;
    const SystemTime start_time_;

    mutable std::mutex mutex_;
    std::string operation_name_;
    std::shared_ptr<const LogSpanContext> context_;
    std::vector<std::pair<std::string, Value>> tags_;
    std::vector<LogRecord> logs_;
    std::optional<SystemTime> finish_time_;
};

struct LogTracerOptions {
    std::string service_name{"tracelink"};
    logging::Level report_level{logging::Level::info};
};

/**
 * @brief Tracer that writes finished spans to a logger. No sampling or export.
 *
 * Text map and HTTP header carriers use the keys `trace-id`, `span-id` (hex) and
 * `baggage-<key>`. For HTTP headers baggage keys and values are percent-encoded,
 * keys with upper-case letters escaped, so they survive header name folding. The binary
 * carrier holds a versioned big-endian record.
 */
class LogTracer final : public Tracer {
public:
    static constexpr std::string_view trace_id_key = "trace-id";
    static constexpr std::string_view span_id_key = "span-id";
    static constexpr std::string_view baggage_prefix = "baggage-";
    static constexpr std::uint8_t binary_version = 1;

    explicit LogTracer(LogTracerOptions options = {}, logging::LoggerPtr logger = logging::library_logger());

    ScopeManager& scope_manager() override { return scope_manager_; }
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

    [[nodiscard]] const LogTracerOptions& options() const noexcept { return options_; }
    [[nodiscard]] const logging::LoggerPtr& logger() const noexcept { return logger_; }

private:
    LogTracerOptions options_;
    logging::LoggerPtr logger_;
    util::ThreadLocalScopeManager scope_manager_;
};

std::uint64_t generate_id();

}  // namespace tracelink::core::observability
