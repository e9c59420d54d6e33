#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tgwire {

class Logger {
public:
    static void init(std::string_view name = "tgwire", std::string_view level = "info");
    /// Returns the shared logger, creating the default one on first use.
    /// Safe to call from several threads.
    static auto get() -> std::shared_ptr<spdlog::logger>;

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace tgwire

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::tgwire::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::tgwire::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::tgwire::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::tgwire::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::tgwire::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::tgwire::Logger::get(), __VA_ARGS__)
