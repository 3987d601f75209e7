#pragma once

#include <memory>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "tracelink/core/logging/config.hpp"

namespace tracelink::core::logging {

/**
 * @brief Named logger backed by spdlog.
 *
 * Messages use fmt syntax; formatting is skipped when the level is filtered out.
 */
class Logger {
public:
    explicit Logger(std::string name);
    Logger(std::string name, const LogConfig& config);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] bool should_log(Level level) const noexcept { return level >= this->level(); }

    void log(Level level, const std::string& message);
    void flush();

    template <typename... Args>
    void log(Level level, fmt::format_string<Args...> format, Args&&... args) {
        if (!should_log(level)) {
            return;
        }
        log(level, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::trace, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        log(Level::error, format, std::forward<Args>(args)...);
    }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

using LoggerPtr = std::shared_ptr<Logger>;

LoggerPtr create_logger(const std::string& name);
LoggerPtr create_logger(const std::string& name, const LogConfig& config);

// Logger used by the library itself. Created on first use with a console sink.
LoggerPtr library_logger();
void set_library_logger(LoggerPtr logger);

// Sets up the spdlog default logger and the library logger from `config`.
void initialize_logging(const LogConfig& config);
void initialize_logging(const config::Configuration& config);

// Flushes and drops every spdlog logger.
void shutdown_logging();

}  // namespace tracelink::core::logging
