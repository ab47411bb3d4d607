/**
 * @file log.hpp
 * @brief Logging interface for saio
 *
 * The library never writes to stderr on its own. Diagnostics (submission
 * failures, reaped requests, contract violations) are routed to a
 * process-wide handler, which is empty by default.
 *
 * Example:
 * @code
 *   saio::set_log_handler([](saio::LogLevel level, std::string_view msg) {
 *       std::cerr << "[" << saio::log_level_name(level) << "] " << msg << "\n";
 *   });
 *
 *   saio::log_emit(saio::LogLevel::Info, "starting");
 *   // ... library and app logs dispatched to the handler ...
 *
 *   saio::clear_log_handler();
 * @endcode
 */

#ifndef SAIO_LOG_HPP
#define SAIO_LOG_HPP

#include <functional>
#include <string_view>

namespace saio {

/// Log severity levels (match syslog priorities 1:1)
enum class LogLevel {
    Error = 3,   ///< Error condition
    Warning = 4, ///< Warning condition
    Notice = 5,  ///< Normal but significant
    Info = 6,    ///< Informational
    Debug = 7    ///< Debug-level
};

/// Return a short name for the given log level ("ERR", "WARN", etc.)
[[nodiscard]] inline const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Notice:
        return "NOTICE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    default:
        return "???";
    }
}

/// Log handler callback type
using LogHandler = std::function<void(LogLevel, std::string_view)>;

/// Install a process-wide log handler.
///
/// Replaces any previously installed handler.  The handler is called from
/// whichever thread emits the log message; it must be thread-safe.
void set_log_handler(LogHandler handler);

/// Remove the current log handler.
///
/// After this call the library is silent (default state).
void clear_log_handler() noexcept;

/// Emit a log message through the registered handler (if any).
///
/// No-op when no handler is installed.  Thread-safe.
void log_emit(LogLevel level, std::string_view msg);

} // namespace saio

#endif // SAIO_LOG_HPP
