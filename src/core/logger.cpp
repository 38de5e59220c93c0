#include "ctxopt/core/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ctxopt {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    void apply_level(spdlog::logger& logger, std::string_view level) {
        if (level == "trace") logger.set_level(spdlog::level::trace);
        else if (level == "debug") logger.set_level(spdlog::level::debug);
        else if (level == "info") logger.set_level(spdlog::level::info);
        else if (level == "warn") logger.set_level(spdlog::level::warn);
        else if (level == "error") logger.set_level(spdlog::level::err);
        else if (level == "critical") logger.set_level(spdlog::level::critical);
        else if (level == "off") logger.set_level(spdlog::level::off);
        else logger.set_level(spdlog::level::info);
    }
}

void Logger::init(std::string_view name, std::string_view level) {
    {
        std::lock_guard lock(g_logger_mutex);
        // stdout belongs to the tool protocol, so log lines go to stderr.
        spdlog::drop(std::string(name));
        g_logger = spdlog::stderr_color_mt(std::string(name));
        g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
        apply_level(*g_logger, level);
    }
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    // Executions log from worker threads; the lazy default must be set once.
    static std::once_flag lazy_init;
    std::call_once(lazy_init, [] {
        bool missing;
        {
            std::lock_guard lock(g_logger_mutex);
            missing = !g_logger;
        }
        if (missing) init();
    });
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    apply_level(*get(), level);
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace ctxopt
