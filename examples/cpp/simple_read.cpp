/**
 * @file simple_read.cpp
 * @brief Simple async file read example
 *
 * Reads the start of a file into a caller-owned array through a Lease.
 *
 * Usage: ./simple_read <file>
 */

#include <saio.hpp>

#include <array>
#include <iostream>
#include <iomanip>
#include <fcntl.h>
#include <unistd.h>

using namespace std::chrono_literals;

constexpr size_t READ_SIZE = 64 * 1024; // 64KB

static void wait_for(const saio::Request &req) {
    const saio::Request *pending[] = {&req};
    while (req.in_progress()) {
        (void)saio::suspend(pending, 100ms);
    }
}

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file>\n";
        std::cerr << "\nReads the first 64KB of a file asynchronously.\n";
        return 1;
    }

    const char *filename = argv[1];

    try {
        int fd = open(filename, O_RDONLY);
        if (fd < 0) {
            throw saio::Error(errno, filename);
        }

        // Storage outlives the lease, the lease outlives the request
        static std::array<std::byte, READ_SIZE> storage;
        saio::Lease lease{std::span<std::byte>(storage)};
        auto req = saio::Request::from_slice(fd, 0, lease);

        std::cout << "Submitting async read of " << READ_SIZE << " bytes...\n";
        req.submit_read();

        std::cout << "Waiting for completion...\n";
        wait_for(req);

        ssize_t result = 0;
        try {
            result = req.collect_result();
            std::cout << "Read " << result << " bytes successfully\n";
        } catch (const saio::Error &e) {
            std::cerr << "Read failed: " << e.what() << "\n";
        }

        // Show first few bytes of data
        if (result > 0) {
            std::cout << "\nFirst 64 bytes of file:\n";
            for (ssize_t i = 0; i < 64 && i < result; i++) {
                auto c = static_cast<unsigned char>(storage[static_cast<size_t>(i)]);
                if (c >= 32 && c < 127) {
                    std::cout << static_cast<char>(c);
                } else {
                    std::cout << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                              << static_cast<int>(c);
                    std::cout << std::dec;
                }
            }
            std::cout << "\n";
        }

        std::cout << "\nRequest: " << req << "\n";
        close(fd);

        std::cout << "\nDone!\n";
        return (result > 0) ? 0 : 1;

    } catch (const saio::Error &e) {
        std::cerr << "saio error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
