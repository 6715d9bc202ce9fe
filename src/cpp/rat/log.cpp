#include "log.hpp"

#include <mutex>
#include <utility>

#include "basic_types.hpp"

namespace {
    std::mutex g_log_mutex;
    rat::LogHandler g_log_handler;
    rat::LogLevel g_log_max_level = rat::LogLevel::debug;
}

namespace rat {
    const char* log_level_name(LogLevel level) {
        switch (level) {
        case LogLevel::error:   return "ERR";
        case LogLevel::warning: return "WARN";
        case LogLevel::notice:  return "NOTICE";
        case LogLevel::info:    return "INFO";
        case LogLevel::debug:   return "DEBUG";
        }
        return "???";
    }

    LogLevel parse_log_level(const std::string& name) {
        if (name == "error" || name == "err")
            return LogLevel::error;
        if (name == "warning" || name == "warn")
            return LogLevel::warning;
        if (name == "notice")
            return LogLevel::notice;
        if (name == "info")
            return LogLevel::info;
        if (name == "debug")
            return LogLevel::debug;
        throw UsageError("invalid log level '" + name + "'");
    }

    void set_log_handler(LogHandler handler, LogLevel max_level) {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_log_handler = std::move(handler);
        g_log_max_level = max_level;
    }

    void clear_log_handler() {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_log_handler = nullptr;
        g_log_max_level = LogLevel::debug;
    }

    bool log_enabled(LogLevel level) {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        return g_log_handler && static_cast<int>(level) <= static_cast<int>(g_log_max_level);
    }

    void log_emit(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (!g_log_handler)
            return;
        if (static_cast<int>(level) > static_cast<int>(g_log_max_level))
            return;
        g_log_handler(level, message);
    }
}
