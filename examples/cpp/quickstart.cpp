/**
 * @file quickstart.cpp
 * @brief Minimal working example of a saio async read
 *
 * Run:   ./quickstart
 */

#include <saio.hpp>

#include <iostream>
#include <fstream>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

using namespace std::chrono_literals;

constexpr size_t BUF_SIZE = 4096;

int main() {
    const char* test_file = "/tmp/saio_quickstart.tmp";
    const char* test_data = "Hello from saio! This is POSIX async I/O.\n";

    try {
        // Create a test file with known content
        {
            std::ofstream out(test_file, std::ios::binary);
            if (!out) {
                std::cerr << "Failed to create test file\n";
                return 1;
            }
            out.write(test_data, static_cast<std::streamsize>(strlen(test_data)));
        }

        int fd = open(test_file, O_RDONLY);
        if (fd < 0) {
            throw saio::Error(errno, "open");
        }

        // The request owns its buffer; it cannot be freed while the read runs
        auto req = saio::Request::from_owned(fd, 0, saio::Bytes::zeroed(BUF_SIZE));
        req.submit_read();

        // Wait for completion
        const saio::Request* pending[] = {&req};
        while (req.in_progress()) {
            (void)saio::suspend(pending, 100ms);
        }

        ssize_t bytes_read = req.collect_result();
        std::cout << "Read completed: " << bytes_read << " bytes\n";

        // Take the buffer back now that the kernel is done with it
        saio::Buffer buffer = req.extract_buffer();
        if (bytes_read > 0) {
            std::cout << "Data read: "
                      << buffer.exclusive()->str().substr(0, static_cast<size_t>(bytes_read));
        }

        close(fd);
        unlink(test_file);

        std::cout << "Success!\n";
        return 0;

    } catch (const saio::Error& e) {
        std::cerr << "saio error: " << e.what() << "\n";
        unlink(test_file);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        unlink(test_file);
        return 1;
    }
}
