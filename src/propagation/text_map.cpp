#include "tracelink/core/propagation/text_map.hpp"

#include "tracelink/core/errors.hpp"

namespace tracelink::core::propagation {

void TextMapExtractAdapter::for_each(const Visitor& visitor) const {
    for (const auto& [key, value] : map_) {
        visitor(key, value);
    }
}

void TextMapExtractAdapter::put(const std::string& /*key*/, const std::string& /*value*/) {
    throw UnsupportedOperation("TextMapExtractAdapter should only be used with Tracer::extract()");
}

void TextMapInjectAdapter::for_each(const Visitor& /*visitor*/) const {
    throw UnsupportedOperation("TextMapInjectAdapter should only be used with Tracer::inject()");
}

void TextMapInjectAdapter::put(const std::string& key, const std::string& value) {
    map_[key] = value;
}

}  // namespace tracelink::core::propagation
