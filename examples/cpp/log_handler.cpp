/**
 * @file log_handler.cpp
 * @brief Demonstrate the saio custom log handler
 *
 * Shows how to install a log callback that formats library messages with
 * timestamps and severity levels, and how to emit application-level
 * messages through the same pipeline using saio::log_emit().  The library
 * reports refused submissions at debug level and requests destroyed
 * without being collected at warning level; both are triggered here.
 *
 * Run:   ./log_handler
 */

#include <saio.hpp>

#include <chrono>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <unistd.h>

using namespace std::chrono_literals;

constexpr auto TEST_FILE = "/tmp/saio_log_test.dat";
constexpr size_t FILE_SIZE = 64 * 1024; // 64 KB
constexpr size_t BUF_SIZE = 4096;

int main() {
    std::cout << "saio Log Handler Example\n";
    std::cout << "========================\n\n";

    // --- Step 1: Install log handler with lambda -------------------------

    saio::set_log_handler([](saio::LogLevel level, std::string_view msg) {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t_now, &tm);

        std::cerr << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
                  << std::setw(3) << ms.count() << " [myapp] " << saio::log_level_name(level)
                  << ": " << msg << '\n';
    });

    // --- Step 2: Emit application-level messages -------------------------
    saio::log_emit(saio::LogLevel::Info, "log handler installed, configuring AIO");

    int fd = -1;

    try {
        // --- Step 3: Configure and do I/O --------------------------------
        saio::configure(saio::Options().threads(4).num(32));

        {
            std::ofstream out(TEST_FILE, std::ios::binary);
            if (!out) {
                saio::log_emit(saio::LogLevel::Error, "failed to create test file");
                saio::clear_log_handler();
                return 1;
            }
            std::string data(FILE_SIZE, 'A');
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
        }

        fd = open(TEST_FILE, O_RDONLY);
        if (fd < 0) {
            saio::log_emit(saio::LogLevel::Error, "failed to open test file");
            unlink(TEST_FILE);
            saio::clear_log_handler();
            return 1;
        }

        saio::log_emit(saio::LogLevel::Debug, "submitting read");
        {
            auto req = saio::Request::from_owned(fd, 0, saio::Bytes::zeroed(BUF_SIZE));
            req.submit_read();

            const saio::Request *pending[] = {&req};
            while (req.in_progress()) {
                (void)saio::suspend(pending, 100ms);
            }

            // Deliberately not collected: the library reaps it and warns
        }

        // --- Step 4: A refused submission --------------------------------
        //
        // Syncing a read-only descriptor is refused up front; the library
        // logs the failure before throwing.
        try {
            auto sync = saio::Request::from_fd(fd);
            sync.submit_fsync();
            const saio::Request *pending[] = {&sync};
            while (sync.in_progress()) {
                (void)saio::suspend(pending, 100ms);
            }
            (void)sync.collect_result();
        } catch (const saio::Error &e) {
            saio::log_emit(saio::LogLevel::Notice, std::string("fsync refused: ") + e.what());
        }

        // --- Step 5: Clean up --------------------------------------------
        close(fd);
        unlink(TEST_FILE);

        saio::log_emit(saio::LogLevel::Notice, "shutting down");

    } catch (const saio::Error &e) {
        saio::log_emit(saio::LogLevel::Error, std::string("saio error: ") + e.what());
        if (fd >= 0) close(fd);
        unlink(TEST_FILE);
        saio::clear_log_handler();
        return 1;
    } catch (const std::exception &e) {
        saio::log_emit(saio::LogLevel::Error, std::string("unexpected error: ") + e.what());
        if (fd >= 0) close(fd);
        unlink(TEST_FILE);
        saio::clear_log_handler();
        return 1;
    }

    saio::clear_log_handler();

    std::cout << "\n--- Summary ---\n";
    std::cout << "The log handler captured all library and application messages\n";
    std::cout << "on stderr with timestamps, severity levels, and an app prefix.\n";
    std::cout << "In production, replace the lambda with your framework's\n";
    std::cout << "logging function (spdlog, syslog, journald, etc.).\n";

    return 0;
}
