/**
 * @file cancel_request.cpp
 * @brief Demonstrates cancelling an in-flight I/O operation
 *
 * Queues two reads on a file, then asks for the second to be cancelled.
 * Cancellation is best-effort: an operation that already finished keeps its
 * result, and a cancelled one reports ECANCELED when collected.  Either way
 * the request must still be collected.
 *
 * Usage: ./cancel_request <file>
 */

#include <saio.hpp>

#include <iostream>
#include <fcntl.h>
#include <unistd.h>

using namespace std::chrono_literals;

constexpr size_t READ_SIZE = 4096;

static const char *status_name(saio::CancelStatus st) {
    switch (st) {
    case saio::CancelStatus::Canceled:
        return "canceled";
    case saio::CancelStatus::NotCanceled:
        return "not canceled (already running)";
    case saio::CancelStatus::AllDone:
        return "all done (already finished)";
    }
    return "unknown";
}

static void report(const char *name, saio::Request &req) {
    const saio::Request *pending[] = {&req};
    while (req.in_progress()) {
        (void)saio::suspend(pending, 100ms);
    }

    try {
        ssize_t n = req.collect_result();
        std::cout << name << ": read " << n << " bytes\n";
    } catch (const saio::Error &e) {
        if (e.is_cancelled()) {
            std::cout << name << ": cancelled\n";
        } else {
            std::cout << name << ": failed (" << e.what() << ")\n";
        }
    }
}

int main(int argc, char *argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file>\n";
        return 1;
    }

    try {
        int fd = open(argv[1], O_RDONLY);
        if (fd < 0) {
            throw saio::Error(errno, argv[1]);
        }

        auto first = saio::Request::from_owned(fd, 0, saio::Bytes::zeroed(READ_SIZE));
        auto second = saio::Request::from_owned(fd, READ_SIZE, saio::Bytes::zeroed(READ_SIZE));

        std::cout << "Submitting two async reads...\n";
        first.submit_read();
        second.submit_read();

        std::cout << "Attempting to cancel the second read...\n";
        saio::CancelStatus st = second.cancel();
        std::cout << "Cancel status: " << status_name(st) << "\n";

        report("first", first);
        report("second", second);

        // Cancel whatever else might still be queued on the descriptor
        st = saio::cancel_all(fd);
        std::cout << "cancel_all: " << status_name(st) << "\n";

        close(fd);
        return 0;

    } catch (const saio::Error &e) {
        std::cerr << "saio error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
