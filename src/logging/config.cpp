#include "tracelink/core/logging/config.hpp"

#include <algorithm>
#include <cctype>

#include "tracelink/core/config/configuration.hpp"

namespace tracelink::core::logging {
namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

SinkType sink_type_from_string(const std::string& str) {
    auto lower = lowercase(str);
    if (lower == "file") return SinkType::File;
    if (lower == "rotating_file" || lower == "rotating") return SinkType::RotatingFile;
    if (lower == "daily_file" || lower == "daily") return SinkType::DailyFile;
    return SinkType::Console;
}

// "10MB", "512kb", "4096"; zero when unparsable
std::size_t parse_size(const std::string& str) {
    std::size_t digits = 0;
    while (digits < str.size() && std::isdigit(static_cast<unsigned char>(str[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        return 0;
    }

    auto unit = lowercase(config::Configuration::trim(str.substr(digits)));
    std::size_t multiplier = 1;
    if (unit == "kb" || unit == "k") {
        multiplier = 1024;
    } else if (unit == "mb" || unit == "m") {
        multiplier = 1024 * 1024;
    } else if (unit == "gb" || unit == "g") {
        multiplier = 1024 * 1024 * 1024;
    } else if (!unit.empty() && unit != "b") {
        return 0;
    }
    return std::stoull(str.substr(0, digits)) * multiplier;
}

}  // namespace

LogConfig LogConfig::default_config() {
    LogConfig config;
    config.add_default_sinks();
    return config;
}

LogConfig LogConfig::from_toml(const config::Configuration& config) {
    LogConfig log_config;

    if (config.contains("logging.level")) {
        log_config.level = level_from_string(config.get_string("logging.level"));
    }
    log_config.pattern = config.get_string("logging.pattern", log_config.pattern);
    log_config.async = config.get_bool("logging.async", log_config.async);
    log_config.queue_size = static_cast<std::size_t>(
        config.get_int("logging.queue_size", static_cast<int>(log_config.queue_size)));
    log_config.flush_interval = std::chrono::seconds(
        config.get_int("logging.flush_interval", static_cast<int>(log_config.flush_interval.count())));

    auto sink_count = config.table_count("logging.sinks");
    for (std::size_t i = 0; i < sink_count; ++i) {
        auto prefix = "logging.sinks[" + std::to_string(i) + "].";

        SinkConfig sink;
        sink.type = sink_type_from_string(config.get_string(prefix + "type", "console"));
        sink.enabled = config.get_bool(prefix + "enabled", true);
        if (config.contains(prefix + "level")) {
            sink.level = level_from_string(config.get_string(prefix + "level"));
        }
        sink.path = config.get_string(prefix + "path");
        if (config.contains(prefix + "max_size")) {
            sink.max_size = parse_size(config.get_string(prefix + "max_size"));
        }
        sink.max_files = static_cast<std::size_t>(
            config.get_int(prefix + "max_files", static_cast<int>(sink.max_files)));
        sink.rotation_hour = config.get_int(prefix + "rotation_hour", sink.rotation_hour);
        sink.rotation_minute = config.get_int(prefix + "rotation_minute", sink.rotation_minute);
        sink.pattern = config.get_string(prefix + "pattern");

        log_config.sinks.push_back(std::move(sink));
    }

    if (log_config.sinks.empty()) {
        log_config.add_default_sinks();
    }
    return log_config;
}

bool LogConfig::validate() const {
    if (level < Level::trace || level > Level::off) {
        return false;
    }
    if (async && queue_size == 0) {
        return false;
    }

    for (const auto& sink : sinks) {
        if (!sink.enabled) {
            continue;
        }
        if (sink.type != SinkType::Console && sink.path.empty()) {
            return false;
        }
        if (sink.type == SinkType::RotatingFile && (sink.max_size == 0 || sink.max_files == 0)) {
            return false;
        }
        if (sink.type == SinkType::DailyFile &&
            (sink.rotation_hour < 0 || sink.rotation_hour > 23 ||
             sink.rotation_minute < 0 || sink.rotation_minute > 59)) {
            return false;
        }
    }
    return true;
}

void LogConfig::add_default_sinks() {
    SinkConfig console_sink;
    console_sink.type = SinkType::Console;
    console_sink.level = level;
    sinks.push_back(console_sink);
}

Level level_from_string(const std::string& str) {
    auto lower = lowercase(str);
    if (lower == "trace") return Level::trace;
    if (lower == "debug") return Level::debug;
    if (lower == "info") return Level::info;
    if (lower == "warn" || lower == "warning") return Level::warn;
    if (lower == "error") return Level::error;
    if (lower == "critical") return Level::critical;
    if (lower == "off") return Level::off;
    return Level::info;
}

std::string level_to_string(Level level) {
    switch (level) {
        case Level::trace:    return "TRACE";
        case Level::debug:    return "DEBUG";
        case Level::info:     return "INFO";
        case Level::warn:     return "WARN";
        case Level::error:    return "ERROR";
        case Level::critical: return "CRITICAL";
        case Level::off:      return "OFF";
        default:              return "UNKNOWN";
    }
}

}  // namespace tracelink::core::logging
