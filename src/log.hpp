/**
 * @file log.hpp
 * @brief Internal logging infrastructure
 *
 * Formats library diagnostics and forwards them to the user-settable
 * handler from <saio/log.hpp>.  Default handler is empty (silent).
 */

#ifndef SAIO_SRC_LOG_HPP
#define SAIO_SRC_LOG_HPP

#include <saio/log.hpp>

namespace saio::detail {

/**
 * Emit a log message through the registered handler (if any).
 *
 * No-op when no handler is registered.  Never throws.
 */
void log(LogLevel level, const char *fmt, ...) noexcept __attribute__((format(printf, 2, 3)));

} // namespace saio::detail

#endif // SAIO_SRC_LOG_HPP
