/**
 * @file batch.hpp
 * @brief Operations over many requests: wait, list submission, cancel by fd
 *
 * None of these take ownership of the requests passed in.
 */

#ifndef SAIO_BATCH_HPP
#define SAIO_BATCH_HPP

#include <saio/fwd.hpp>
#include <saio/notification.hpp>
#include <saio/request.hpp>

#include <aio.h>

#include <chrono>
#include <optional>
#include <span>

// Probed at configure time; fall back to what the platform is known to ship
#ifndef SAIO_HAVE_LIO_LISTIO
#if defined(__APPLE__)
#define SAIO_HAVE_LIO_LISTIO 0
#else
#define SAIO_HAVE_LIO_LISTIO 1
#endif
#endif

namespace saio {

/**
 * Blocking behaviour of submit_many()
 */
enum class LioMode {
    Wait = LIO_WAIT,    ///< Return once every listed operation has completed
    NoWait = LIO_NOWAIT ///< Return as soon as the operations are queued
};

/**
 * Why suspend() returned
 */
enum class WaitStatus {
    Ready,      ///< At least one listed request is no longer pending (or none was in flight)
    TimedOut,   ///< The timeout elapsed first
    Interrupted ///< A signal interrupted the wait
};

/**
 * Cancel every outstanding operation on a file descriptor
 *
 * Useful before closing a descriptor whose individual requests are not at
 * hand.  Requests reported as canceled still have to be collected.
 *
 * @param fd File descriptor
 * @return Aggregate cancellation outcome
 * @throws Error if @p fd is invalid
 */
[[nodiscard]] CancelStatus cancel_all(int fd);

/**
 * Block until at least one listed request stops being pending
 *
 * Results are not collected.  Requests that are not in flight are ignored;
 * if none of the listed requests is in flight (including an empty list) the
 * call returns Ready immediately.
 *
 * @param requests Requests to wait on
 * @param timeout Maximum time to wait (nullopt = no limit)
 * @return Reason for returning
 * @throws Error on any failure other than timeout or interruption
 */
[[nodiscard]] WaitStatus suspend(std::span<const Request *const> requests,
                                 std::optional<std::chrono::nanoseconds> timeout = std::nullopt);

#if SAIO_HAVE_LIO_LISTIO

/// Whether submit_many() is available on this platform
inline constexpr bool has_list_submission = true;

/**
 * Submit many requests with one call
 *
 * Each request's own opcode selects read or write; Nop requests (and null
 * entries) are skipped.  No ordering among the requests is guaranteed.
 * On success every submitted request is in flight and must be collected;
 * in Wait mode they have already completed.
 *
 * Listing a request that is in flight, listing one twice, or asking for a
 * read into an immutable buffer aborts the process.
 *
 * @param mode Wait for completion or return after queueing
 * @param requests Requests to submit
 * @param notification Delivered once all NoWait operations complete
 * @throws Error if the call fails.  After EIO or EINTR every listed request
 *         is marked in flight.  Otherwise only requests still reporting
 *         EINPROGRESS are; one that was queued and already finished looks
 *         the same as one that was refused, so it stays idle and its
 *         result is lost.  Prefer LioMode::Wait, or individual submits,
 *         where that matters for writes.
 */
void submit_many(LioMode mode, std::span<Request *const> requests,
                 const Notification &notification = {});

#else

inline constexpr bool has_list_submission = false;

#endif

} // namespace saio

#endif // SAIO_BATCH_HPP
