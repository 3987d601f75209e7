#include "tracelink/core/logging/logger.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "tracelink/core/config/configuration.hpp"

namespace tracelink::core::logging {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%d %H:%M:%S.%e [%n] [%l] [tid %t] %v";

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::trace:    return spdlog::level::trace;
        case Level::debug:    return spdlog::level::debug;
        case Level::info:     return spdlog::level::info;
        case Level::warn:     return spdlog::level::warn;
        case Level::error:    return spdlog::level::err;
        case Level::critical: return spdlog::level::critical;
        case Level::off:      return spdlog::level::off;
        default:              return spdlog::level::info;
    }
}

Level from_spdlog_level(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return Level::trace;
        case spdlog::level::debug:    return Level::debug;
        case spdlog::level::info:     return Level::info;
        case spdlog::level::warn:     return Level::warn;
        case spdlog::level::err:      return Level::error;
        case spdlog::level::critical: return Level::critical;
        case spdlog::level::off:      return Level::off;
        default:                      return Level::info;
    }
}

spdlog::sink_ptr create_sink(const SinkConfig& config, const std::string& default_pattern) {
    if (!config.enabled) {
        return nullptr;
    }

    spdlog::sink_ptr sink;
    switch (config.type) {
        case SinkType::Console:
            sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            break;
        case SinkType::File:
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.path.string(), false);
            break;
        case SinkType::RotatingFile:
            sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.path.string(), config.max_size, config.max_files);
            break;
        case SinkType::DailyFile:
            sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                config.path.string(), config.rotation_hour, config.rotation_minute, false,
                static_cast<std::uint16_t>(config.max_files));
            break;
        default:
            throw std::runtime_error("Unknown sink type");
    }

    sink->set_level(to_spdlog_level(config.level));
    sink->set_pattern(config.pattern.empty() ? default_pattern : config.pattern);
    return sink;
}

std::shared_ptr<spdlog::logger> build_logger(const std::string& name, const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    for (const auto& sink_config : config.sinks) {
        if (auto sink = create_sink(sink_config, config.pattern)) {
            sinks.push_back(std::move(sink));
        }
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        // spdlog keeps one global pool; the first async logger sizes it.
        if (!spdlog::thread_pool()) {
            spdlog::init_thread_pool(config.queue_size, 1);
        }
        logger = std::make_shared<spdlog::async_logger>(
            name, sinks.begin(), sinks.end(), spdlog::thread_pool(), spdlog::async_overflow_policy::block);
        spdlog::flush_every(config.flush_interval);
    } else {
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    }

    logger->set_level(to_spdlog_level(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::mutex g_logging_mutex;
bool g_logging_initialized = false;
LoggerPtr g_library_logger;

}  // namespace

class Logger::Impl {
public:
    explicit Impl(std::string name) : name_(std::move(name)) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(kDefaultPattern);
        spdlog_logger_ = std::make_shared<spdlog::logger>(name_, std::move(console_sink));
        spdlog_logger_->set_level(spdlog::level::info);
    }

    Impl(std::string name, const LogConfig& config)
        : name_(std::move(name)), spdlog_logger_(build_logger(name_, config)) {}

    void set_level(Level level) { spdlog_logger_->set_level(to_spdlog_level(level)); }
    [[nodiscard]] Level level() const { return from_spdlog_level(spdlog_logger_->level()); }
    [[nodiscard]] const std::string& name() const { return name_; }

    void log(Level level, const std::string& message) {
        spdlog_logger_->log(to_spdlog_level(level), message);
    }

    void flush() { spdlog_logger_->flush(); }

private:
    std::string name_;
    std::shared_ptr<spdlog::logger> spdlog_logger_;
};

Logger::Logger(std::string name) : impl_(std::make_unique<Impl>(std::move(name))) {}

Logger::Logger(std::string name, const LogConfig& config)
    : impl_(std::make_unique<Impl>(std::move(name), config)) {}

Logger::~Logger() = default;
Logger::Logger(Logger&&) noexcept = default;
Logger& Logger::operator=(Logger&&) noexcept = default;

void Logger::set_level(Level level) noexcept {
    impl_->set_level(level);
}

Level Logger::level() const noexcept {
    return impl_->level();
}

const std::string& Logger::name() const noexcept {
    return impl_->name();
}

void Logger::log(Level level, const std::string& message) {
    impl_->log(level, message);
}

void Logger::flush() {
    impl_->flush();
}

LoggerPtr create_logger(const std::string& name) {
    return std::make_shared<Logger>(name);
}

LoggerPtr create_logger(const std::string& name, const LogConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid logging configuration for logger " + name);
    }
    return std::make_shared<Logger>(name, config);
}

LoggerPtr library_logger() {
    std::lock_guard lock{g_logging_mutex};
    if (!g_library_logger) {
        g_library_logger = std::make_shared<Logger>("tracelink");
    }
    return g_library_logger;
}

void set_library_logger(LoggerPtr logger) {
    std::lock_guard lock{g_logging_mutex};
    g_library_logger = std::move(logger);
}

void initialize_logging(const LogConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid logging configuration");
    }

    std::lock_guard lock{g_logging_mutex};
    if (g_logging_initialized) {
        return;
    }

    auto logger = std::make_shared<Logger>("tracelink", config);
    spdlog::set_default_logger(build_logger("default", config));
    g_library_logger = std::move(logger);
    g_logging_initialized = true;
}

void initialize_logging(const config::Configuration& config) {
    initialize_logging(LogConfig::from_toml(config));
}

void shutdown_logging() {
    std::lock_guard lock{g_logging_mutex};
    if (g_library_logger) {
        g_library_logger->flush();
    }
    g_library_logger.reset();
    spdlog::shutdown();
    g_logging_initialized = false;
}

}  // namespace tracelink::core::logging
