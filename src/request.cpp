/**
 * @file request.cpp
 * @brief Request submission, status and buffer ownership
 */

#include <saio/request.hpp>
#include <saio/error.hpp>

#include "contract.hpp"
#include "log.hpp"
#include "native.hpp"

#include <algorithm>
#include <cstring>
#include <ostream>

namespace saio {

namespace detail {

CancelStatus to_cancel_status(int rc, const char *context) {
    switch (rc) {
    case AIO_CANCELED:
        return CancelStatus::Canceled;
    case AIO_NOTCANCELED:
        return CancelStatus::NotCanceled;
    case AIO_ALLDONE:
        return CancelStatus::AllDone;
    case -1:
        throw_errno(context);
    default:
        contract_violation("%s returned unknown value %d", context, rc);
    }
}

} // namespace detail

// =============================================================================
// Construction
// =============================================================================

Request::Request(int fd, const RequestOptions &opts) noexcept {
    // Reserved fields are OS-specific; some kernels keep state in them and
    // expect them zeroed on allocation
    std::memset(&cb_, 0, sizeof(cb_));
    cb_.aio_fildes = fd;
    cb_.aio_reqprio = opts.priority();
    cb_.aio_sigevent = opts.notification().native();
    cb_.aio_lio_opcode = static_cast<int>(opts.opcode());
}

void Request::bind(std::byte *ptr, size_t len, off_t offset, bool is_mutable) noexcept {
    cb_.aio_buf = ptr;
    cb_.aio_nbytes = len;
    cb_.aio_offset = offset;
    mutable_ = is_mutable;
}

Request Request::from_fd(int fd, const RequestOptions &opts) {
    return Request(fd, opts);
}

Request Request::from_slice(int fd, off_t offset, Lease &lease, const RequestOptions &opts) {
    if (!lease.is_mutable() && opts.opcode() == Opcode::Read) {
        detail::contract_violation("Opcode::Read on an immutable lease (fd %d)", fd);
    }
    Request req(fd, opts);
    req.buffer_ = Buffer(Borrowed(lease.data_, lease.size_, lease.mutable_, lease.state_));
    req.bind(lease.data_, lease.size_, offset, lease.mutable_);
    return req;
}

Request Request::from_shared(int fd, off_t offset, SharedBytes buf, const RequestOptions &opts) {
    if (opts.opcode() == Opcode::Read) {
        detail::contract_violation("Opcode::Read on an immutable shared buffer (fd %d)", fd);
    }
    // Inline storage moves with the object; the kernel needs a fixed address
    if (buf.is_inline()) {
        buf = SharedBytes::copy_out_of_line(buf.span());
    }
    Request req(fd, opts);
    req.buffer_ = Buffer(std::move(buf));
    const SharedBytes *held = req.buffer_.shared();
    req.bind(const_cast<std::byte *>(held->data()), held->size(), offset, false);
    return req;
}

Request Request::from_owned(int fd, off_t offset, Bytes buf, const RequestOptions &opts) {
    if (buf.is_inline()) {
        Bytes ool = Bytes::with_capacity(std::max(buf.size(), Bytes::inline_capacity + 1));
        ool.extend(buf.span());
        buf = std::move(ool);
    }
    Request req(fd, opts);
    req.buffer_ = Buffer(std::move(buf));
    Bytes *held = req.buffer_.exclusive();
    req.bind(held->data(), held->size(), offset, true);
    return req;
}

Request Request::unsafe_from_mut_ptr(int fd, off_t offset, void *buf, size_t len,
                                     const RequestOptions &opts) {
    Request req(fd, opts);
    req.bind(static_cast<std::byte *>(buf), len, offset, true);
    return req;
}

Request Request::unsafe_from_ptr(int fd, off_t offset, const void *buf, size_t len,
                                 const RequestOptions &opts) {
    if (opts.opcode() == Opcode::Read) {
        detail::contract_violation("Opcode::Read on an immutable pointer (fd %d)", fd);
    }
    Request req(fd, opts);
    // The pointer is only ever read through, since mutable_ is false
    req.bind(static_cast<std::byte *>(const_cast<void *>(buf)), len, offset, false);
    return req;
}

Request::Request(Request &&other) noexcept
    : buffer_(std::move(other.buffer_)), mutable_(other.mutable_) {
    if (other.in_flight_) {
        detail::contract_violation("moved an in-flight request (fd %d)", other.fd());
    }
    std::memcpy(&cb_, &other.cb_, sizeof(cb_));
    other.buffer_ = Buffer();
    other.cb_.aio_buf = nullptr;
    other.cb_.aio_nbytes = 0;
    other.mutable_ = false;
}

Request &Request::operator=(Request &&other) noexcept {
    if (this != &other) {
        if (in_flight_ || other.in_flight_) {
            detail::contract_violation("move-assigned an in-flight request (fd %d <- fd %d)",
                                       fd(), other.fd());
        }
        std::memcpy(&cb_, &other.cb_, sizeof(cb_));
        buffer_ = std::move(other.buffer_);
        mutable_ = other.mutable_;
        other.buffer_ = Buffer();
        other.cb_.aio_buf = nullptr;
        other.cb_.aio_nbytes = 0;
        other.mutable_ = false;
    }
    return *this;
}

Request::~Request() {
    if (!in_flight_) {
        return;
    }
    int status = aio_error(&cb_);
    if (status == EINPROGRESS) {
        detail::contract_violation("destroyed an in-flight request (fd %d, offset %lld)", fd(),
                                   static_cast<long long>(cb_.aio_offset));
    }
    if (status == -1) {
        detail::log(LogLevel::Warning, "destroying request on fd %d unknown to the kernel (errno %d)",
                    fd(), errno);
    } else {
        // Completed but never collected; reap it so the kernel can release it
        ssize_t rc = aio_return(&cb_);
        detail::log(LogLevel::Warning,
                    "destroying uncollected request on fd %d (result %zd, error %d)", fd(), rc,
                    status);
    }
    mark_collected();
}

// =============================================================================
// Submission
// =============================================================================

void Request::check_submittable(const char *name) const noexcept {
    if (in_flight_) {
        detail::contract_violation("%s on fd %d while already in flight", name, fd());
    }
    if (const Borrowed *b = buffer_.borrowed(); b && b->expired()) {
        detail::contract_violation("%s on fd %d after its lease was released", name, fd());
    }
}

void Request::mark_submitted() noexcept {
    in_flight_ = true;
    if (const Borrowed *b = buffer_.borrowed()) {
        b->pin();
    }
}

void Request::mark_collected() noexcept {
    in_flight_ = false;
    if (const Borrowed *b = buffer_.borrowed()) {
        b->unpin();
    }
}

void Request::submit(int (*native)(struct aiocb *), const char *name) {
    check_submittable(name);
    if (native(&cb_) != 0) {
        int err = errno;
        detail::log(LogLevel::Debug, "%s on fd %d failed: %s", name, fd(),
                    std::generic_category().message(err).c_str());
        throw Error(err, name);
    }
    mark_submitted();
}

void Request::submit_read() {
    if (!mutable_) {
        detail::contract_violation("read into an immutable buffer (fd %d)", fd());
    }
    submit(aio_read, "aio_read");
}

void Request::submit_write() {
    submit(aio_write, "aio_write");
}

void Request::submit_fsync(FsyncMode mode) {
    check_submittable("aio_fsync");
    if (aio_fsync(static_cast<int>(mode), &cb_) != 0) {
        int err = errno;
        detail::log(LogLevel::Debug, "aio_fsync on fd %d failed: %s", fd(),
                    std::generic_category().message(err).c_str());
        throw Error(err, "aio_fsync");
    }
    mark_submitted();
}

// =============================================================================
// Status
// =============================================================================

CancelStatus Request::cancel() {
    return detail::to_cancel_status(aio_cancel(cb_.aio_fildes, &cb_), "aio_cancel");
}

std::error_code Request::poll_error() const {
    int rc = aio_error(&cb_);
    if (rc == 0) {
        return {};
    }
    if (rc > 0) {
        return {rc, std::generic_category()};
    }
    check(rc != -1, "aio_error");
    detail::contract_violation("aio_error returned unknown value %d (fd %d)", rc, fd());
}

bool Request::in_progress() const {
    return poll_error().value() == EINPROGRESS;
}

ssize_t Request::collect_result() {
    if (!in_flight_) {
        detail::contract_violation("collect_result on fd %d with no submitted operation", fd());
    }
    int status = aio_error(&cb_);
    if (status == EINPROGRESS) {
        detail::contract_violation("collect_result on fd %d before completion", fd());
    }
    int query_err = errno;
    mark_collected();
    if (status == -1) {
        throw Error(query_err, "aio_error");
    }

    ssize_t rc = aio_return(&cb_);
    if (rc < 0) {
        // aio_return does not always set errno; the status carries the cause
        throw Error(status > 0 ? status : errno, "aio_return");
    }
    return rc;
}

// =============================================================================
// Buffer
// =============================================================================

Buffer Request::extract_buffer() {
    if (in_flight_) {
        detail::contract_violation("extract_buffer on fd %d while in flight", fd());
    }
    Buffer out = std::move(buffer_);
    buffer_ = Buffer();
    if (!out.is_none()) {
        cb_.aio_buf = nullptr;
        cb_.aio_nbytes = 0;
        mutable_ = false;
    }
    return out;
}

Buffer Request::into_buffer() && {
    Buffer out = extract_buffer();
    if (out.borrowed()) {
        return Buffer();
    }
    return out;
}

void Request::set_notification(const Notification &n) noexcept {
    cb_.aio_sigevent = n.native();
}

// =============================================================================
// Accessors
// =============================================================================

std::optional<Opcode> Request::opcode() const noexcept {
    switch (cb_.aio_lio_opcode) {
    case LIO_NOP:
        return Opcode::Nop;
    case LIO_READ:
        return Opcode::Read;
    case LIO_WRITE:
        return Opcode::Write;
    default:
        return std::nullopt;
    }
}

Notification Request::notification() const {
    return Notification::from_native(cb_.aio_sigevent);
}

std::ostream &operator<<(std::ostream &os, const Request &req) {
    static const char *const kinds[] = {"none", "shared", "exclusive", "borrowed"};
    auto op = req.opcode();
    os << "Request { fd: " << req.fd() << ", offset: " << req.offset()
       << ", buf: " << req.data() << ", nbytes: " << req.nbytes() << ", opcode: ";
    if (!op) {
        os << "unknown(" << req.native_handle()->aio_lio_opcode << ")";
    } else if (*op == Opcode::Read) {
        os << "read";
    } else if (*op == Opcode::Write) {
        os << "write";
    } else {
        os << "nop";
    }
    os << ", priority: " << req.priority()
       << ", notify: " << req.native_handle()->aio_sigevent.sigev_notify
       << ", buffer: " << kinds[static_cast<int>(req.buffer_kind())]
       << ", mutable: " << (req.is_mutable() ? "true" : "false")
       << ", in_flight: " << (req.in_flight() ? "true" : "false") << " }";
    return os;
}

} // namespace saio
