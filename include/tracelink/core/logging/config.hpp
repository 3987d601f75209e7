#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace tracelink::core {
namespace config {
class Configuration;
}
}

namespace tracelink::core::logging {

enum class Level {
    trace = 0,
    debug,
    info,
    warn,
    error,
    critical,
    off
};

enum class SinkType {
    Console,
    File,
    RotatingFile,
    DailyFile
};

struct SinkConfig {
    SinkType type{SinkType::Console};
    bool enabled{true};
    Level level{Level::trace};

    // File-specific options
    std::filesystem::path path;
    std::size_t max_size{10 * 1024 * 1024};  // 10MB
    std::size_t max_files{5};
    int rotation_hour{0};
    int rotation_minute{0};

    // Overrides LogConfig::pattern when not empty
    std::string pattern;
};

struct LogConfig {
    Level level{Level::info};
    std::string pattern{"%Y-%m-%d %H:%M:%S.%e [%n] [%l] [tid %t] %v"};

    // Async logging settings
    bool async{false};
    std::size_t queue_size{8192};
    std::chrono::seconds flush_interval{3};

    std::vector<SinkConfig> sinks;

    static LogConfig default_config();

    // Reads the [logging] section and its [[logging.sinks]] tables.
    static LogConfig from_toml(const config::Configuration& config);

    [[nodiscard]] bool validate() const;

private:
    void add_default_sinks();
};

Level level_from_string(const std::string& str);
std::string level_to_string(Level level);

}  // namespace tracelink::core::logging
