#pragma once

#include <string_view>

// Conventional keys for Span::log field maps.
namespace tracelink::core::log_fields {

inline constexpr std::string_view error_kind = "error.kind";
inline constexpr std::string_view error_object = "error.object";
inline constexpr std::string_view event = "event";
inline constexpr std::string_view message = "message";
inline constexpr std::string_view stack = "stack";

}  // namespace tracelink::core::log_fields
