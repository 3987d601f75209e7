#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "tracelink/core/span.hpp"

namespace tracelink::core::tag {

// Typed tag key; set() writes the tag with the value type the convention expects.
template <typename T>
class Tag {
public:
    constexpr explicit Tag(std::string_view key) noexcept : key_(key) {}

    [[nodiscard]] constexpr std::string_view key() const noexcept { return key_; }

    void set(Span& span, T value) const { span.set_tag(std::string{key_}, Value{std::move(value)}); }

private:
    std::string_view key_;
};

using StringTag = Tag<std::string>;
using IntTag = Tag<std::int64_t>;
using BooleanTag = Tag<bool>;

class IntOrStringTag : public Tag<std::int64_t> {
public:
    using Tag<std::int64_t>::Tag;
    using Tag<std::int64_t>::set;

    void set(Span& span, std::string value) const {
        span.set_tag(std::string{key()}, Value{std::move(value)});
    }
};

// span.kind values
inline constexpr std::string_view span_kind_server = "server";
inline constexpr std::string_view span_kind_client = "client";
inline constexpr std::string_view span_kind_producer = "producer";
inline constexpr std::string_view span_kind_consumer = "consumer";

inline constexpr StringTag service{"service"};

inline constexpr StringTag http_url{"http.url"};
inline constexpr IntTag http_status{"http.status_code"};
inline constexpr StringTag http_method{"http.method"};

inline constexpr IntOrStringTag peer_host_ipv4{"peer.ipv4"};
inline constexpr StringTag peer_host_ipv6{"peer.ipv6"};
inline constexpr StringTag peer_service{"peer.service"};
inline constexpr StringTag peer_hostname{"peer.hostname"};
inline constexpr IntTag peer_port{"peer.port"};

// Non-zero asks the tracer to keep the trace, zero to drop it.
inline constexpr IntTag sampling_priority{"sampling.priority"};

inline constexpr StringTag span_kind{"span.kind"};
inline constexpr StringTag component{"component"};
inline constexpr BooleanTag error{"error"};

inline constexpr StringTag db_type{"db.type"};
inline constexpr StringTag db_instance{"db.instance"};
inline constexpr StringTag db_user{"db.user"};
inline constexpr StringTag db_statement{"db.statement"};

inline constexpr StringTag message_bus_destination{"message_bus.destination"};

}  // namespace tracelink::core::tag
