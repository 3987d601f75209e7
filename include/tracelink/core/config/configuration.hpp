#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tracelink::core::config {

/**
 * @brief Flat view of a TOML subset.
 *
 * Keys are stored as "section.key"; the n-th [[array]] table becomes
 * "array[n].key". Values keep their raw text and are converted on access.
 */
class Configuration {
public:
    Configuration() = default;

    static Configuration load_from_file(const std::filesystem::path& path);
    static Configuration load_from_string(std::string_view text);

    [[nodiscard]] const std::filesystem::path& source_path() const noexcept { return source_path_; }
    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::string get_string(std::string_view key, std::string default_value = "") const;
    [[nodiscard]] bool get_bool(std::string_view key, bool default_value = false) const;
    [[nodiscard]] int get_int(std::string_view key, int default_value = 0) const;
    [[nodiscard]] std::vector<std::string> get_list(std::string_view key) const;
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

    // Number of [[name]] tables that were parsed.
    [[nodiscard]] std::size_t table_count(std::string_view name) const;

    // Keys of the form "name[i].key" also extend table_count("name").
    void set(std::string key, std::string value);

    static std::string trim(std::string_view text);
    static std::string strip_quotes(std::string_view text);

private:
    void parse(std::istream& input);

    std::unordered_map<std::string, std::string> values_{};
    std::unordered_map<std::string, std::size_t> table_counts_{};
    std::filesystem::path source_path_{};
};

}  // namespace tracelink::core::config
