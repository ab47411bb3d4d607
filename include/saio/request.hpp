/**
 * @file request.hpp
 * @brief Request class for saio
 */

#ifndef SAIO_REQUEST_HPP
#define SAIO_REQUEST_HPP

#include <saio/fwd.hpp>
#include <saio/buffer.hpp>
#include <saio/notification.hpp>

#include <aio.h>
#include <fcntl.h>
#include <sys/types.h>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <system_error>

namespace saio {

/**
 * Mode for Request::submit_fsync()
 */
enum class FsyncMode {
    Sync = O_SYNC, ///< Flush data and metadata, like fsync()
#if defined(O_DSYNC)
    DataSync = O_DSYNC ///< Flush data only, like fdatasync()
#endif
};

/// Whether FsyncMode::DataSync exists on this platform
#if defined(O_DSYNC)
inline constexpr bool has_data_sync = true;
#else
inline constexpr bool has_data_sync = false;
#endif

/**
 * Per-request operation used by submit_many()
 *
 * Has no effect on the individual submit_* calls.
 */
enum class Opcode {
    Nop = LIO_NOP,    ///< Skipped by list submission
    Read = LIO_READ,  ///< Read into the request's buffer
    Write = LIO_WRITE ///< Write from the request's buffer
};

/**
 * Result of Request::cancel() and cancel_all()
 */
enum class CancelStatus {
    Canceled = AIO_CANCELED,       ///< All targeted operations were canceled
    NotCanceled = AIO_NOTCANCELED, ///< Some are still running; check each with poll_error()
    AllDone = AIO_ALLDONE          ///< Everything had already completed
};

/**
 * Per-request configuration
 *
 * Uses builder pattern for fluent configuration.
 *
 * Example:
 * @code
 * auto opts = saio::RequestOptions()
 *                 .priority(1)
 *                 .opcode(saio::Opcode::Write);
 * auto req = saio::Request::from_owned(fd, 0, std::move(bytes), opts);
 * @endcode
 */
class RequestOptions {
  public:
    RequestOptions() noexcept = default;

    /**
     * Set priority hint
     *
     * With POSIX prioritized I/O the operation runs at the process priority
     * minus @p prio.  Forwarded as-is.
     *
     * @param prio Priority decrement (default: 0)
     * @return Reference to this for chaining
     */
    RequestOptions &priority(int prio) noexcept {
        priority_ = prio;
        return *this;
    }

    /**
     * Set completion notification
     * @param n Notification descriptor (default: none)
     * @return Reference to this for chaining
     */
    RequestOptions &notification(const Notification &n) noexcept {
        notification_ = n;
        return *this;
    }

    /**
     * Set the operation used by submit_many()
     * @param op Operation (default: Nop)
     * @return Reference to this for chaining
     */
    RequestOptions &opcode(Opcode op) noexcept {
        opcode_ = op;
        return *this;
    }

    // Getters
    [[nodiscard]] int priority() const noexcept { return priority_; }
    [[nodiscard]] const Notification &notification() const noexcept { return notification_; }
    [[nodiscard]] Opcode opcode() const noexcept { return opcode_; }

  private:
    int priority_ = 0;
    Notification notification_;
    Opcode opcode_ = Opcode::Nop;
};

namespace detail {
struct RequestAccess;
} // namespace detail

/**
 * One asynchronous I/O request
 *
 * Owns a native aiocb and the buffer the kernel reads from or writes into.
 *
 * @par Lifecycle
 * Idle -> submit_read()/submit_write()/submit_fsync() -> in flight ->
 * (kernel completes, seen through poll_error()) -> collect_result() -> Idle.
 * While in flight the kernel holds pointers to both the buffer and the
 * aiocb inside this object, so the request must not be moved, destroyed or
 * have its buffer extracted.  Each of those aborts the process.
 *
 * Destroying a request whose operation has completed but was never
 * collected is allowed: the destructor reaps the result and logs a warning.
 *
 * A Request is a single-owner handle; it is not safe to use from several
 * threads at once, but it may be handed between threads while idle.
 *
 * Example:
 * @code
 * auto req = saio::Request::from_owned(fd, 0, saio::Bytes::zeroed(4096));
 * req.submit_read();
 * while (req.in_progress()) {
 *     const saio::Request *list[] = {&req};
 *     (void)saio::suspend(list);
 * }
 * ssize_t n = req.collect_result();
 * saio::Buffer buf = req.extract_buffer();
 * @endcode
 */
class Request {
  public:
    // =========================================================================
    // Construction
    // =========================================================================

    /**
     * Request with no buffer, suitable for submit_fsync()
     * @param fd File descriptor
     * @param opts Priority, notification and opcode
     * @return Idle request
     */
    [[nodiscard]] static Request from_fd(int fd, const RequestOptions &opts = {});

    /**
     * Request over memory lent through a Lease (zero copy)
     *
     * Mutability follows the lease.  The lease must outlive every submitted
     * operation; it aborts the process otherwise.
     *
     * @param fd File descriptor
     * @param offset File offset
     * @param lease Lent memory
     * @param opts Priority, notification and opcode
     * @return Idle request
     */
    [[nodiscard]] static Request from_slice(int fd, off_t offset, Lease &lease,
                                            const RequestOptions &opts = {});

    /**
     * Request owning a shared, immutable buffer (writes only)
     * @param fd File descriptor
     * @param offset File offset
     * @param buf Buffer; copied out of line if stored inline
     * @param opts Priority, notification and opcode
     * @return Idle request
     */
    [[nodiscard]] static Request from_shared(int fd, off_t offset, SharedBytes buf,
                                             const RequestOptions &opts = {});

    /**
     * Request owning an exclusive, mutable buffer (reads and writes)
     * @param fd File descriptor
     * @param offset File offset
     * @param buf Buffer; reallocated out of line if stored inline
     * @param opts Priority, notification and opcode
     * @return Idle request
     */
    [[nodiscard]] static Request from_owned(int fd, off_t offset, Bytes buf,
                                            const RequestOptions &opts = {});

    /**
     * Request over a raw mutable pointer
     *
     * @warning Nothing is checked.  The caller guarantees @p buf points to
     *          @p len valid bytes that stay alive, unaliased and at the same
     *          address until the operation is collected.
     */
    [[nodiscard]] static Request unsafe_from_mut_ptr(int fd, off_t offset, void *buf, size_t len,
                                                     const RequestOptions &opts = {});

    /**
     * Request over a raw const pointer (writes only)
     *
     * @warning Nothing is checked.  See unsafe_from_mut_ptr().
     */
    [[nodiscard]] static Request unsafe_from_ptr(int fd, off_t offset, const void *buf, size_t len,
                                                 const RequestOptions &opts = {});

    /**
     * Move constructor - aborts if @p other is in flight
     */
    Request(Request &&other) noexcept;

    /**
     * Move assignment - aborts if either request is in flight
     */
    Request &operator=(Request &&other) noexcept;

    // Non-copyable
    Request(const Request &) = delete;
    Request &operator=(const Request &) = delete;

    /**
     * Destructor - aborts if the operation is still pending
     */
    ~Request();

    // =========================================================================
    // Submission
    // =========================================================================

    /**
     * Submit async read into the buffer
     *
     * Aborts if the buffer is immutable.
     *
     * @throws Error if the kernel refuses the request (request stays idle)
     */
    void submit_read();

    /**
     * Submit async write from the buffer
     * @throws Error if the kernel refuses the request (request stays idle)
     */
    void submit_write();

    /**
     * Submit async fsync of the file descriptor
     * @param mode Data and metadata, or data only
     * @throws Error if the kernel refuses the request (request stays idle)
     */
    void submit_fsync(FsyncMode mode = FsyncMode::Sync);

    // =========================================================================
    // Status
    // =========================================================================

    /**
     * Ask the kernel to cancel this operation
     *
     * Does not end the in-flight state; poll_error() and collect_result()
     * are still required.
     *
     * @return Cancellation outcome
     * @throws Error if the file descriptor is invalid
     */
    [[nodiscard]] CancelStatus cancel();

    /**
     * Non-blocking status query
     *
     * @return EINPROGRESS while pending, empty on success, otherwise the
     *         operation's error
     * @throws Error if the status cannot be queried
     */
    [[nodiscard]] std::error_code poll_error() const;

    /**
     * Check whether the operation is still pending
     * @return True while poll_error() reports EINPROGRESS
     */
    [[nodiscard]] bool in_progress() const;

    /**
     * Collect the result of a completed operation
     *
     * Must be called exactly once per submission, after poll_error() has
     * stopped reporting EINPROGRESS.  Anything else aborts the process.
     *
     * @return Bytes transferred (0 for fsync)
     * @throws Error with the operation's error if it failed
     */
    [[nodiscard]] ssize_t collect_result();

    // =========================================================================
    // Buffer
    // =========================================================================

    /**
     * Take the buffer out of the request, leaving none behind
     *
     * Aborts if the request is in flight.  When a buffer is removed the
     * native pointer and length are cleared as well.
     *
     * @return The request's buffer
     */
    [[nodiscard]] Buffer extract_buffer();

    /**
     * Consume the request and return its owned buffer
     *
     * Borrowed memory is reported as none.
     *
     * @return Owned buffer, or none
     */
    [[nodiscard]] Buffer into_buffer() &&;

    /**
     * Replace the notification used by the next submission
     * @param n Notification descriptor
     */
    void set_notification(const Notification &n) noexcept;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] int fd() const noexcept { return cb_.aio_fildes; }
    [[nodiscard]] off_t offset() const noexcept { return cb_.aio_offset; }

    /**
     * Requested length of the operation
     *
     * Use collect_result() for the number of bytes actually transferred.
     *
     * @return Requested length in bytes
     */
    [[nodiscard]] size_t nbytes() const noexcept { return cb_.aio_nbytes; }

    /// Address handed to the kernel (nullptr for fsync-only requests)
    [[nodiscard]] const void *data() const noexcept {
        return const_cast<const void *>(cb_.aio_buf);
    }

    [[nodiscard]] int priority() const noexcept { return cb_.aio_reqprio; }

    /**
     * Operation used by submit_many()
     * @return Opcode, or nullopt if the native value is not recognised
     */
    [[nodiscard]] std::optional<Opcode> opcode() const noexcept;

    [[nodiscard]] Notification notification() const;
    [[nodiscard]] bool is_mutable() const noexcept { return mutable_; }
    [[nodiscard]] bool in_flight() const noexcept { return in_flight_; }
    [[nodiscard]] BufferKind buffer_kind() const noexcept { return buffer_.kind(); }

    /**
     * Get underlying native control block
     * @return Pointer to struct aiocb
     */
    [[nodiscard]] struct aiocb *native_handle() noexcept { return &cb_; }
    [[nodiscard]] const struct aiocb *native_handle() const noexcept { return &cb_; }

  private:
    friend struct detail::RequestAccess;

    Request(int fd, const RequestOptions &opts) noexcept;

    void bind(std::byte *ptr, size_t len, off_t offset, bool is_mutable) noexcept;
    void submit(int (*native)(struct aiocb *), const char *name);
    void check_submittable(const char *name) const noexcept;
    void mark_submitted() noexcept;
    void mark_collected() noexcept;

    struct aiocb cb_;
    Buffer buffer_;
    bool mutable_ = false;
    bool in_flight_ = false;
};

/**
 * Debug rendering of every field of a request
 */
std::ostream &operator<<(std::ostream &os, const Request &req);

} // namespace saio

#endif // SAIO_REQUEST_HPP
