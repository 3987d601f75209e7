#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace tracelink::core {

using SystemTime = std::chrono::system_clock::time_point;

// Tag and log field payload.
using Value = std::variant<bool, double, std::int64_t, std::uint64_t, std::string>;

using LogFields = std::unordered_map<std::string, Value>;

std::string to_string(const Value& value);

/**
 * @brief Propagable state of a span: trace identity plus baggage.
 *
 * Implementations are immutable once handed out; the library only reads them.
 */
class SpanContext {
public:
    using BaggageVisitor = std::function<bool(const std::string& key, const std::string& value)>;

    virtual ~SpanContext() = default;

    // Calls `visitor` for every baggage entry until it returns false.
    virtual void for_each_baggage_item(const BaggageVisitor& visitor) const = 0;
};

using SpanContextPtr = std::shared_ptr<const SpanContext>;

/**
 * @brief A single timed unit of work.
 */
class Span {
public:
    virtual ~Span() = default;

    [[nodiscard]] virtual SpanContextPtr context() const = 0;

    virtual void set_tag(const std::string& key, const Value& value) = 0;

    virtual void log(const LogFields& fields) = 0;
    virtual void log(SystemTime timestamp, const LogFields& fields) = 0;
    virtual void log(std::string_view event) = 0;
    virtual void log(SystemTime timestamp, std::string_view event) = 0;

    virtual void set_baggage_item(const std::string& key, const std::string& value) = 0;
    [[nodiscard]] virtual std::optional<std::string> baggage_item(const std::string& key) const = 0;

    virtual void set_operation_name(std::string_view name) = 0;

    virtual void finish() = 0;
    virtual void finish(SystemTime finish_time) = 0;
};

using SpanPtr = std::shared_ptr<Span>;

}  // namespace tracelink::core
