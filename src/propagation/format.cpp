#include "tracelink/core/propagation/format.hpp"

namespace tracelink::core::propagation {

std::string_view to_string(BuiltinFormat format) noexcept {
    switch (format) {
        case BuiltinFormat::text_map:     return "Builtin.TEXT_MAP";
        case BuiltinFormat::http_headers: return "Builtin.HTTP_HEADERS";
        case BuiltinFormat::binary:       return "Builtin.BINARY";
        default:                          return "Builtin.UNKNOWN";
    }
}

}  // namespace tracelink::core::propagation
