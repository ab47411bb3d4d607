/**
 * @file batch.cpp
 * @brief Wait, list submission and descriptor-wide cancellation
 */

#include <saio/batch.hpp>
#include <saio/error.hpp>

#include "contract.hpp"
#include "log.hpp"
#include "native.hpp"

#include <algorithm>
#include <ctime>
#include <vector>

namespace saio {

using detail::RequestAccess;

CancelStatus cancel_all(int fd) {
    return detail::to_cancel_status(aio_cancel(fd, nullptr), "aio_cancel");
}

WaitStatus suspend(std::span<const Request *const> requests,
                   std::optional<std::chrono::nanoseconds> timeout) {
    // A separate native array; Request is not layout-compatible with aiocb
    std::vector<const struct aiocb *> list;
    list.reserve(requests.size());
    for (const Request *req : requests) {
        if (req && req->in_flight()) {
            list.push_back(RequestAccess::control_block(*req));
        }
    }
    if (list.empty()) {
        return WaitStatus::Ready;
    }

    struct timespec ts {};
    const struct timespec *tsp = nullptr;
    if (timeout) {
        auto ns = std::max<std::chrono::nanoseconds::rep>(timeout->count(), 0);
        ts.tv_sec = static_cast<time_t>(ns / 1000000000);
        ts.tv_nsec = static_cast<long>(ns % 1000000000);
        tsp = &ts;
    }

    if (aio_suspend(list.data(), static_cast<int>(list.size()), tsp) == 0) {
        return WaitStatus::Ready;
    }
    switch (errno) {
    case EAGAIN:
        return WaitStatus::TimedOut;
    case EINTR:
        return WaitStatus::Interrupted;
    default:
        throw_errno("aio_suspend");
    }
}

#if SAIO_HAVE_LIO_LISTIO

void submit_many(LioMode mode, std::span<Request *const> requests,
                 const Notification &notification) {
    std::vector<Request *> queued;
    std::vector<struct aiocb *> list;
    queued.reserve(requests.size());
    list.reserve(requests.size());

    for (Request *req : requests) {
        if (!req) {
            continue;
        }
        auto op = req->opcode();
        if (!op) {
            detail::contract_violation("lio_listio: request on fd %d has unknown opcode %d",
                                       req->fd(), RequestAccess::control_block(*req)->aio_lio_opcode);
        }
        if (*op == Opcode::Nop) {
            continue;
        }
        RequestAccess::check_submittable(*req, "lio_listio");
        if (*op == Opcode::Read && !req->is_mutable()) {
            detail::contract_violation("lio_listio: read into an immutable buffer (fd %d)",
                                       req->fd());
        }
        queued.push_back(req);
        list.push_back(RequestAccess::control_block(*req));
    }
    if (list.empty()) {
        return;
    }

    std::vector<Request *> sorted(queued);
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        detail::contract_violation("lio_listio: the same request is listed twice");
    }

    // lio_listio takes a non-const sigevent
    struct sigevent sev = notification.native();
    if (lio_listio(static_cast<int>(mode), list.data(), static_cast<int>(list.size()), &sev) == 0) {
        for (Request *req : queued) {
            RequestAccess::mark_submitted(*req);
        }
        return;
    }

    // EIO and EINTR mean every entry was queued; otherwise only the ones
    // still running are the kernel's
    int err = errno;
    bool all_queued = err == EIO || err == EINTR;
    size_t marked = 0;
    for (Request *req : queued) {
        if (all_queued || aio_error(RequestAccess::control_block(*req)) == EINPROGRESS) {
            RequestAccess::mark_submitted(*req);
            ++marked;
        }
    }
    detail::log(LogLevel::Warning, "lio_listio of %zu request(s) failed (errno %d), %zu in flight",
                queued.size(), err, marked);
    throw Error(err, "lio_listio");
}

#endif

} // namespace saio
