#pragma once

#include <functional>
#include <string>

namespace rat {
    /** Log severity levels. Values match syslog priorities. */
    enum class LogLevel : int {
        error   = 3,
        warning = 4,
        notice  = 5,
        info    = 6,
        debug   = 7
    };

    /** Short upper case name of the level ("ERR", "WARN", ...) */
    const char* log_level_name(LogLevel level);

    /** Parses "error", "warning", "notice", "info" or "debug".

        @throw UsageError for anything else.
    */
    LogLevel parse_log_level(const std::string& name);

    typedef std::function<void(LogLevel, const std::string&)> LogHandler;

    /** Installs a process-wide log handler, replacing any previous one.

        @param handler  called for every message at or above max_level
        @param max_level  least severe level that still reaches the handler
    */
    void set_log_handler(LogHandler handler, LogLevel max_level = LogLevel::debug);

    /** Removes the handler. The library is silent afterwards, which is also
        the state before any handler is set.
    */
    void clear_log_handler();

    /** @return true if a message at level would reach a handler. */
    bool log_enabled(LogLevel level);

    /** Sends message to the handler, if one is installed. Thread safe. */
    void log_emit(LogLevel level, const std::string& message);
}
