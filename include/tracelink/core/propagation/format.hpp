#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tracelink::core::propagation {

class TextMap;

// Opaque byte buffer used with Builtin::binary.
using BinaryCarrier = std::vector<std::uint8_t>;

enum class BuiltinFormat {
    text_map,
    http_headers,
    binary
};

struct Builtin;

/**
 * @brief Identifies a carrier encoding and statically ties it to the carrier type
 * the encoding reads from and writes to.
 *
 * Only the instances in Builtin exist; the set is closed.
 */
template <typename Carrier>
class Format {
public:
    using carrier_type = Carrier;

    [[nodiscard]] constexpr BuiltinFormat id() const noexcept { return id_; }

    friend constexpr bool operator==(Format lhs, Format rhs) noexcept { return lhs.id_ == rhs.id_; }
    friend constexpr bool operator!=(Format lhs, Format rhs) noexcept { return lhs.id_ != rhs.id_; }

private:
    friend struct Builtin;
    constexpr explicit Format(BuiltinFormat id) noexcept : id_(id) {}

    BuiltinFormat id_;
};

struct Builtin {
    // Arbitrary string key/value pairs, no character restrictions.
    static constexpr Format<TextMap> text_map{BuiltinFormat::text_map};

    // Same shape as text_map but keys and values must survive as HTTP headers.
    static constexpr Format<TextMap> http_headers{BuiltinFormat::http_headers};

    static constexpr Format<BinaryCarrier> binary{BuiltinFormat::binary};
};

std::string_view to_string(BuiltinFormat format) noexcept;

template <typename Carrier>
std::string to_string(Format<Carrier> format) {
    return std::string{to_string(format.id())};
}

}  // namespace tracelink::core::propagation
