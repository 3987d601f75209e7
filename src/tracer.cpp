#include "tracelink/core/tracer.hpp"

#include <cstdio>
#include <type_traits>

namespace tracelink::core {

std::string_view to_string(ReferenceType type) noexcept {
    switch (type) {
        case ReferenceType::child_of:     return "child_of";
        case ReferenceType::follows_from: return "follows_from";
        default:                          return "unknown";
    }
}

std::string to_string(const Value& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                char buffer[32];
                std::snprintf(buffer, sizeof(buffer), "%g", v);
                return buffer;
            } else {
                return std::to_string(v);
            }
        },
        value);
}

}  // namespace tracelink::core
