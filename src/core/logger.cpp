#include "tgwire/core/logger.hpp"
#include "tgwire/core/utils.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace tgwire {

namespace {
    std::mutex g_mutex;
    std::shared_ptr<spdlog::logger> g_logger;

    auto parse_level(std::string_view level) -> spdlog::level::level_enum {
        auto name = utils::to_lower(level);
        if (name == "trace") return spdlog::level::trace;
        if (name == "debug") return spdlog::level::debug;
        if (name == "warn") return spdlog::level::warn;
        if (name == "error") return spdlog::level::err;
        if (name == "critical") return spdlog::level::critical;
        return spdlog::level::info;
    }

    // Caller holds g_mutex.
    void create_locked(std::string_view name, std::string_view level) {
        // Re-initialising replaces the registered logger of the same name.
        spdlog::drop(std::string(name));
        // stdout carries request bodies for the CLI, so diagnostics go to stderr.
        auto logger = spdlog::stderr_color_mt(std::string(name));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
        logger->set_level(parse_level(level));
        g_logger = std::move(logger);
    }
}

void Logger::init(std::string_view name, std::string_view level) {
    std::lock_guard lock(g_mutex);
    create_locked(name, level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(g_mutex);
    if (!g_logger) {
        create_locked("tgwire", "info");
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    get()->set_level(parse_level(level));
}

void Logger::flush() {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard lock(g_mutex);
        logger = g_logger;
    }
    if (logger) logger->flush();
}

} // namespace tgwire
