#include "tracelink/core/config/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tracelink::core::config {
namespace {

std::string qualify(std::string_view section, std::string_view key) {
    if (section.empty()) {
        return std::string{key};
    }
    std::string qualified;
    qualified.reserve(section.size() + 1 + key.size());
    qualified.append(section);
    qualified.push_back('.');
    qualified.append(key);
    return qualified;
}

// Drops a trailing "# comment" that is not inside a quoted string.
std::string_view strip_comment(std::string_view line) {
    char quote = '\0';
    for (std::size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            }
        } else if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::vector<std::string> split_list(std::string_view raw) {
    std::vector<std::string> items;
    if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
        return items;
    }

    std::string current;
    bool quoted = false;
    auto flush = [&]() {
        auto item = Configuration::trim(current);
        if (!item.empty()) {
            items.push_back(Configuration::strip_quotes(item));
        }
        current.clear();
    };

    for (char ch : raw.substr(1, raw.size() - 2)) {
        if (ch == '"') {
            quoted = !quoted;
            current.push_back(ch);
        } else if (ch == ',' && !quoted) {
            flush();
        } else {
            current.push_back(ch);
        }
    }
    flush();
    return items;
}

}  // namespace

Configuration Configuration::load_from_file(const std::filesystem::path& path) {
    std::ifstream input{path};
    if (!input) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    Configuration config;
    config.source_path_ = path;
    config.parse(input);
    return config;
}

Configuration Configuration::load_from_string(std::string_view text) {
    std::istringstream input{std::string{text}};
    Configuration config;
    config.parse(input);
    return config;
}

void Configuration::parse(std::istream& input) {
    std::string section;
    std::string line;
    while (std::getline(input, line)) {
        auto text = trim(strip_comment(line));
        if (text.empty()) {
            continue;
        }

        if (text.size() > 4 && text.compare(0, 2, "[[") == 0 && text.compare(text.size() - 2, 2, "]]") == 0) {
            auto name = trim(std::string_view{text}.substr(2, text.size() - 4));
            auto index = table_counts_[name]++;
            section = name + "[" + std::to_string(index) + "]";
            continue;
        }
        if (text.front() == '[' && text.back() == ']') {
            section = trim(std::string_view{text}.substr(1, text.size() - 2));
            continue;
        }

        auto equals = text.find('=');
        if (equals == std::string::npos) {
            continue;
        }
        auto key = trim(std::string_view{text}.substr(0, equals));
        if (key.empty()) {
            continue;
        }
        values_[qualify(section, key)] = trim(std::string_view{text}.substr(equals + 1));
    }
}

bool Configuration::contains(std::string_view key) const {
    return values_.count(std::string{key}) != 0;
}

std::string Configuration::get_string(std::string_view key, std::string default_value) const {
    auto it = values_.find(std::string{key});
    if (it == values_.end()) {
        return default_value;
    }
    return strip_quotes(it->second);
}

bool Configuration::get_bool(std::string_view key, bool default_value) const {
    auto raw = get_string(key);
    std::transform(raw.begin(), raw.end(), raw.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (raw == "true" || raw == "1" || raw == "yes") {
        return true;
    }
    if (raw == "false" || raw == "0" || raw == "no") {
        return false;
    }
    return default_value;
}

int Configuration::get_int(std::string_view key, int default_value) const {
    auto raw = get_string(key);
    int value = 0;
    auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || end != raw.data() + raw.size() || raw.empty()) {
        return default_value;
    }
    return value;
}

std::vector<std::string> Configuration::get_list(std::string_view key) const {
    auto it = values_.find(std::string{key});
    if (it == values_.end()) {
        return {};
    }
    return split_list(it->second);
}

std::size_t Configuration::table_count(std::string_view name) const {
    auto it = table_counts_.find(std::string{name});
    return it == table_counts_.end() ? 0 : it->second;
}

void Configuration::set(std::string key, std::string value) {
    // "name[3].key" makes at least four [[name]] tables visible
    auto open = key.find('[');
    auto close = key.find("].", open);
    if (open != std::string::npos && open > 0 && close != std::string::npos) {
        std::size_t index = 0;
        auto [end, ec] = std::from_chars(key.data() + open + 1, key.data() + close, index);
        if (ec == std::errc{} && end == key.data() + close) {
            auto& count = table_counts_[key.substr(0, open)];
            count = std::max(count, index + 1);
        }
    }
    values_[std::move(key)] = std::move(value);
}

std::string Configuration::trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(begin, end - begin + 1)};
}

std::string Configuration::strip_quotes(std::string_view text) {
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
        return std::string{text.substr(1, text.size() - 2)};
    }
    return std::string{text};
}

}  // namespace tracelink::core::config
