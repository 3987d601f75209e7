#include "tracelink/core/observability/log_tracer.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <random>
#include <stdexcept>

#include "tracelink/core/log_fields.hpp"

namespace tracelink::core::observability {
namespace {

using propagation::BinaryCarrier;
using propagation::Builtin;
using propagation::TextMap;

std::string lowercase(std::string_view text) {
    std::string lower{text};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string to_hex(std::uint64_t id) {
    return fmt::format("{:016x}", id);
}

std::uint64_t parse_id(const std::string& text, std::string_view key) {
    std::uint64_t id = 0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, id, 16);
    if (text.empty() || text.size() > 16 || result.ec != std::errc{} || result.ptr != end) {
        throw std::invalid_argument(fmt::format("malformed {} '{}' in span context", key, text));
    }
    if (id == 0) {
        throw std::invalid_argument(fmt::format("{} must not be zero", key));
    }
    return id;
}

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

// Header names are case-insensitive, so upper-case letters are escaped as well.
bool is_header_name_char(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string percent_encode(const std::string& value, bool (*keep)(unsigned char) = is_unreserved) {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char c : value) {
        if (keep(c)) {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(digits[c >> 4]);
            encoded.push_back(digits[c & 0x0F]);
        }
    }
    return encoded;
}

std::string percent_decode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '%') {
            decoded.push_back(value[i]);
            continue;
        }
        unsigned int byte = 0;
        auto begin = value.data() + i + 1;
        auto end = begin + 2;
        if (i + 2 >= value.size() ||
            std::from_chars(begin, end, byte, 16).ptr != end) {
            throw std::invalid_argument("malformed percent-encoding in baggage entry '" + value + "'");
        }
        decoded.push_back(static_cast<char>(byte));
        i += 2;
    }
    return decoded;
}

void put_u32(BinaryCarrier& out, std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

void put_u64(BinaryCarrier& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

void put_string(BinaryCarrier& out, const std::string& value) {
    put_u32(out, static_cast<std::uint32_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

class BinaryReader {
public:
    explicit BinaryReader(const BinaryCarrier& buffer) noexcept : buffer_(buffer) {}

    std::uint8_t u8() {
        require(1);
        return buffer_[offset_++];
    }

    std::uint32_t u32() {
        require(4);
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | buffer_[offset_++];
        }
        return value;
    }

    std::uint64_t u64() {
        require(8);
        std::uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | buffer_[offset_++];
        }
        return value;
    }

    std::string string() {
        auto size = u32();
        require(size);
        std::string value(buffer_.begin() + static_cast<std::ptrdiff_t>(offset_),
                          buffer_.begin() + static_cast<std::ptrdiff_t>(offset_ + size));
        offset_ += size;
        return value;
    }

    [[nodiscard]] std::size_t remaining() const noexcept { return buffer_.size() - offset_; }

private:
    void require(std::size_t size) const {
        if (remaining() < size) {
            throw std::invalid_argument("truncated binary span context");
        }
    }

    const BinaryCarrier& buffer_;
    std::size_t offset_{0};
};

std::shared_ptr<const LogSpanContext> find_parent(const std::vector<SpanReference>& references) {
    std::shared_ptr<const LogSpanContext> parent;
    for (const auto& reference : references) {
        auto candidate = std::dynamic_pointer_cast<const LogSpanContext>(reference.context);
        if (!candidate) {
            continue;
        }
        if (reference.type == ReferenceType::child_of) {
            return candidate;
        }
        if (!parent) {
            parent = std::move(candidate);
        }
    }
    return parent;
}

void upsert_tag(std::vector<std::pair<std::string, Value>>& tags, const std::string& key, const Value& value) {
    auto it = std::find_if(tags.begin(), tags.end(), [&key](const auto& tag) { return tag.first == key; });
    if (it != tags.end()) {
        it->second = value;
    } else {
        tags.emplace_back(key, value);
    }
}

class LogSpanBuilder final : public SpanBuilder {
public:
    LogSpanBuilder(LogTracer& tracer, std::string operation_name)
        : tracer_(tracer), operation_name_(std::move(operation_name)) {}

    SpanBuilder& add_reference(ReferenceType type, SpanContextPtr referenced) override {
        if (referenced) {
            references_.push_back(SpanReference{type, std::move(referenced)});
        }
        return *this;
    }

    SpanBuilder& ignore_active_span() override {
        ignore_active_span_ = true;
        return *this;
    }

    SpanBuilder& with_tag(const std::string& key, const Value& value) override {
        upsert_tag(tags_, key, value);
        return *this;
    }

    SpanBuilder& with_start_timestamp(SystemTime start_time) override {
        start_time_ = start_time;
        return *this;
    }

    [[nodiscard]] ScopePtr start_active(bool finish_on_close) override {
        return tracer_.scope_manager().activate(start(), finish_on_close);
    }

    [[nodiscard]] SpanPtr start() override {
        if (references_.empty() && !ignore_active_span_) {
            if (auto active = tracer_.active_span()) {
                references_.push_back(SpanReference{ReferenceType::child_of, active->context()});
            }
        }

        LogSpanContext::Baggage baggage;
        for (const auto& reference : references_) {
            reference.context->for_each_baggage_item([&baggage](const std::string& key, const std::string& value) {
                baggage.emplace(key, value);
                return true;
            });
        }

        auto parent = find_parent(references_);
        auto trace_id = parent ? parent->trace_id() : generate_id();
        auto parent_id = parent ? parent->span_id() : std::uint64_t{0};
        auto context = std::make_shared<const LogSpanContext>(trace_id, generate_id(), std::move(baggage));

        tracer_.logger()->debug("span started: operation={} trace_id={} span_id={} parent_id={}",
                                operation_name_, to_hex(trace_id), to_hex(context->span_id()), to_hex(parent_id));

        return std::make_shared<LogSpan>(tracer_.logger(),
                                         tracer_.options().report_level,
                                         tracer_.options().service_name,
                                         operation_name_,
                                         std::move(context),
                                         parent_id,
                                         references_,
                                         tags_,
                                         start_time_.value_or(std::chrono::system_clock::now()));
    }

private:
    LogTracer& tracer_;
    std::string operation_name_;
    std::vector<SpanReference> references_;
    std::vector<std::pair<std::string, Value>> tags_;
    std::optional<SystemTime> start_time_;
    bool ignore_active_span_{false};
};

}  // namespace

std::uint64_t generate_id() {
    thread_local std::mt19937_64 engine{[] {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device()};
        return std::mt19937_64{seed};
    }()};

    std::uint64_t id = 0;
    while (id == 0) {
        id = engine();
    }
    return id;
}

// LogSpanContext

LogSpanContext::LogSpanContext(std::uint64_t trace_id, std::uint64_t span_id, Baggage baggage)
    : trace_id_(trace_id), span_id_(span_id), baggage_(std::move(baggage)) {}

void LogSpanContext::for_each_baggage_item(const BaggageVisitor& visitor) const {
    for (const auto& [key, value] : baggage_) {
        if (!visitor(key, value)) {
            return;
        }
    }
}

std::optional<std::string> LogSpanContext::baggage_item(const std::string& key) const {
    auto it = baggage_.find(key);
    if (it == baggage_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<const LogSpanContext> LogSpanContext::with_baggage_item(const std::string& key,
                                                                        const std::string& value) const {
    auto baggage = baggage_;
    baggage[key] = value;
    return std::make_shared<const LogSpanContext>(trace_id_, span_id_, std::move(baggage));
}

// LogSpan

LogSpan::LogSpan(logging::LoggerPtr logger,
                 logging::Level report_level,
                 std::string service_name,
                 std::string operation_name,
                 std::shared_ptr<const LogSpanContext> context,
                 std::uint64_t parent_id,
                 std::vector<SpanReference> references,
                 std::vector<std::pair<std::string, Value>> tags,
                 SystemTime start_time)
    : logger_(std::move(logger)),
      report_level_(report_level),
      service_name_(std::move(service_name)),
      parent_id_(parent_id),
      references_(std::move(references)),
      start_time_(start_time),
      operation_name_(std::move(operation_name)),
      context_(std::move(context)),
      tags_(std::move(tags)) {}

SpanContextPtr LogSpan::context() const {
    return log_context();
}

std::shared_ptr<const LogSpanContext> LogSpan::log_context() const {
    std::lock_guard lock{mutex_};
    return context_;
}

void LogSpan::set_tag(const std::string& key, const Value& value) {
    std::lock_guard lock{mutex_};
    upsert_tag(tags_, key, value);
}

void LogSpan::log(const LogFields& fields) {
    log(std::chrono::system_clock::now(), fields);
}

void LogSpan::log(SystemTime timestamp, const LogFields& fields) {
    std::lock_guard lock{mutex_};
    logs_.push_back(LogRecord{timestamp, fields});
}

void LogSpan::log(std::string_view event) {
    log(std::chrono::system_clock::now(), event);
}

void LogSpan::log(SystemTime timestamp, std::string_view event) {
    log(timestamp, LogFields{{std::string{log_fields::event}, Value{std::string{event}}}});
}

void LogSpan::set_baggage_item(const std::string& key, const std::string& value) {
    std::lock_guard lock{mutex_};
    context_ = context_->with_baggage_item(key, value);
}

std::optional<std::string> LogSpan::baggage_item(const std::string& key) const {
    return log_context()->baggage_item(key);
}

void LogSpan::set_operation_name(std::string_view name) {
    std::lock_guard lock{mutex_};
    operation_name_ = std::string{name};
}

void LogSpan::finish() {
    finish(std::chrono::system_clock::now());
}

void LogSpan::finish(SystemTime finish_time) {
    std::string summary;
    {
        std::lock_guard lock{mutex_};
        if (finish_time_) {
            return;
        }
        finish_time_ = finish_time;

        for (const auto& [key, value] : tags_) {
            if (!summary.empty()) {
                summary.append(", ");
            }
            summary.append(key).append("=").append(core::to_string(value));
        }
    }
    report(finish_time, summary);
}

void LogSpan::report(SystemTime finish_time, const std::string& summary) const {
    if (!logger_ || !logger_->should_log(report_level_)) {
        return;
    }
    auto context = log_context();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(finish_time - start_time_);
    logger_->log(report_level_,
                 "span finished: service={} operation={} trace_id={} span_id={} parent_id={} "
                 "duration_us={} tags=[{}] logs={}",
                 service_name_, operation_name(), to_hex(context->trace_id()), to_hex(context->span_id()),
                 to_hex(parent_id_), duration.count(), summary, logs().size());
}

std::string LogSpan::operation_name() const {
    std::lock_guard lock{mutex_};
    return operation_name_;
}

std::optional<SystemTime> LogSpan::finish_time() const {
    std::lock_guard lock{mutex_};
    return finish_time_;
}

bool LogSpan::finished() const {
    std::lock_guard lock{mutex_};
    return finish_time_.has_value();
}

std::optional<Value> LogSpan::tag(const std::string& key) const {
    std::lock_guard lock{mutex_};
    auto it = std::find_if(tags_.begin(), tags_.end(), [&key](const auto& tag) { return tag.first == key; });
    if (it == tags_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<LogSpan::LogRecord> LogSpan::logs() const {
    std::lock_guard lock{mutex_};
    return logs_;
}

// LogTracer

LogTracer::LogTracer(LogTracerOptions options, logging::LoggerPtr logger)
    : options_(std::move(options)), logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("LogTracer requires a logger");
    }
}

SpanPtr LogTracer::active_span() {
    auto* scope = scope_manager_.active();
    return scope == nullptr ? nullptr : scope->span();
}

SpanBuilderPtr LogTracer::build_span(std::string_view operation_name) {
    return std::make_unique<LogSpanBuilder>(*this, std::string{operation_name});
}

void LogTracer::inject(const SpanContext& context,
                       propagation::Format<TextMap> format,
                       TextMap& carrier) {
    const auto* log_context = dynamic_cast<const LogSpanContext*>(&context);
    if (log_context == nullptr) {
        logger_->debug("{}: not injecting a span context created by another tracer", to_string());
        return;
    }

    const bool http = format == Builtin::http_headers;
    carrier.put(std::string{trace_id_key}, to_hex(log_context->trace_id()));
    carrier.put(std::string{span_id_key}, to_hex(log_context->span_id()));
    for (const auto& [key, value] : log_context->baggage()) {
        if (http) {
            carrier.put(std::string{baggage_prefix} + percent_encode(key, is_header_name_char), percent_encode(value));
        } else {
            carrier.put(std::string{baggage_prefix} + key, value);
        }
    }
}

void LogTracer::inject(const SpanContext& context,
                       propagation::Format<BinaryCarrier> /*format*/,
                       BinaryCarrier& carrier) {
    const auto* log_context = dynamic_cast<const LogSpanContext*>(&context);
    if (log_context == nullptr) {
        logger_->debug("{}: not injecting a span context created by another tracer", to_string());
        return;
    }

    carrier.clear();
    carrier.push_back(binary_version);
    put_u64(carrier, log_context->trace_id());
    put_u64(carrier, log_context->span_id());
    put_u32(carrier, static_cast<std::uint32_t>(log_context->baggage().size()));
    for (const auto& [key, value] : log_context->baggage()) {
        put_string(carrier, key);
        put_string(carrier, value);
    }
}

SpanContextPtr LogTracer::extract(propagation::Format<TextMap> format, const TextMap& carrier) {
    const bool http = format == Builtin::http_headers;
    std::optional<std::string> trace_id;
    std::optional<std::string> span_id;
    LogSpanContext::Baggage baggage;

    carrier.for_each([&](const std::string& key, const std::string& value) {
        auto lower = lowercase(key);
        if (lower == trace_id_key) {
            trace_id = value;
        } else if (lower == span_id_key) {
            span_id = value;
        } else if (lower.compare(0, baggage_prefix.size(), baggage_prefix) == 0) {
            if (http) {
                baggage[percent_decode(lower.substr(baggage_prefix.size()))] = percent_decode(value);
            } else {
                baggage[key.substr(baggage_prefix.size())] = value;
            }
        }
    });

    if (!trace_id && !span_id) {
        return nullptr;
    }
    if (!trace_id || !span_id) {
        throw std::invalid_argument(fmt::format("incomplete span context in {}: missing {}",
                                                propagation::to_string(format),
                                                trace_id ? span_id_key : trace_id_key));
    }
    return std::make_shared<const LogSpanContext>(parse_id(*trace_id, trace_id_key),
                                                  parse_id(*span_id, span_id_key),
                                                  std::move(baggage));
}

SpanContextPtr LogTracer::extract(propagation::Format<BinaryCarrier> /*format*/, const BinaryCarrier& carrier) {
    if (carrier.empty()) {
        return nullptr;
    }

    BinaryReader reader{carrier};
    auto version = reader.u8();
    if (version != binary_version) {
        throw std::invalid_argument(fmt::format("unsupported binary span context version {}", version));
    }
    auto trace_id = reader.u64();
    auto span_id = reader.u64();
    auto count = reader.u32();
    // every entry needs at least two length prefixes
    if (count > reader.remaining() / 8) {
        throw std::invalid_argument("truncated binary span context");
    }

    LogSpanContext::Baggage baggage;
    for (std::uint32_t i = 0; i < count; ++i) {
        auto key = reader.string();
        baggage[std::move(key)] = reader.string();
    }
    if (reader.remaining() != 0) {
        throw std::invalid_argument("trailing bytes after binary span context");
    }
    if (trace_id == 0 || span_id == 0) {
        throw std::invalid_argument("binary span context carries a zero id");
    }
    return std::make_shared<const LogSpanContext>(trace_id, span_id, std::move(baggage));
}

std::string LogTracer::to_string() const {
    return "LogTracer{service=" + options_.service_name + "}";
}

}  // namespace tracelink::core::observability
