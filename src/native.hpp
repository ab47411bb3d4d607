/**
 * @file native.hpp
 * @brief Mapping of native AIO return codes
 */

#ifndef SAIO_SRC_NATIVE_HPP
#define SAIO_SRC_NATIVE_HPP

#include <saio/request.hpp>

namespace saio::detail {

/**
 * Map an aio_cancel() return value
 *
 * -1 becomes Error(errno); values outside the POSIX set abort.
 */
CancelStatus to_cancel_status(int rc, const char *context);

/// Grants the batch primitives access to Request internals
struct RequestAccess {
    static struct aiocb *control_block(Request &req) noexcept { return &req.cb_; }
    static const struct aiocb *control_block(const Request &req) noexcept { return &req.cb_; }
    static void check_submittable(const Request &req, const char *name) noexcept {
        req.check_submittable(name);
    }
    static void mark_submitted(Request &req) noexcept { req.mark_submitted(); }
};

} // namespace saio::detail

#endif // SAIO_SRC_NATIVE_HPP
