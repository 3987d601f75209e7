#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>

namespace tracelink::core::propagation {

/**
 * @brief String-to-string carrier used by Builtin::text_map and Builtin::http_headers.
 */
class TextMap {
public:
    using Visitor = std::function<void(const std::string& key, const std::string& value)>;

    virtual ~TextMap() = default;

    // Visits every entry exactly once, in unspecified order.
    virtual void for_each(const Visitor& visitor) const = 0;

    virtual void put(const std::string& key, const std::string& value) = 0;
};

/**
 * @brief Read-only TextMap over a caller-owned map, for use with Tracer::extract.
 *
 * The map must outlive the adapter, so temporaries are rejected. put() throws
 * UnsupportedOperation.
 */
class TextMapExtractAdapter final : public TextMap {
public:
    using Map = std::unordered_map<std::string, std::string>;

    explicit TextMapExtractAdapter(const Map& map) noexcept : map_(map) {}
    explicit TextMapExtractAdapter(Map&&) = delete;

    void for_each(const Visitor& visitor) const override;
    void put(const std::string& key, const std::string& value) override;

    [[nodiscard]] Map::const_iterator begin() const noexcept { return map_.begin(); }
    [[nodiscard]] Map::const_iterator end() const noexcept { return map_.end(); }
    [[nodiscard]] std::size_t size() const noexcept { return map_.size(); }

private:
    const Map& map_;
};

/**
 * @brief Write-only TextMap over a caller-owned map, for use with Tracer::inject.
 *
 * The map must outlive the adapter. for_each() throws UnsupportedOperation.
 */
class TextMapInjectAdapter final : public TextMap {
public:
    using Map = std::unordered_map<std::string, std::string>;

    explicit TextMapInjectAdapter(Map& map) noexcept : map_(map) {}
    explicit TextMapInjectAdapter(Map&&) = delete;

    void for_each(const Visitor& visitor) const override;
    void put(const std::string& key, const std::string& value) override;

private:
    Map& map_;
};

}  // namespace tracelink::core::propagation
