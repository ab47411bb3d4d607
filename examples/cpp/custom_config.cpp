/**
 * @file custom_config.cpp
 * @brief Demonstrate saio configuration and request options
 *
 * Shows how to tune the AIO implementation before first use (worker
 * threads, expected request count, idle time) and how per-request options
 * select priority and completion notification.
 *
 * Run:   ./custom_config
 */

#include <saio.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

using namespace std::chrono_literals;

constexpr const char *TEST_FILE = "/tmp/saio_config_test.dat";
constexpr size_t FILE_SIZE = 4 * 1024 * 1024; // 4 MB
constexpr size_t BUF_SIZE = 4096;
constexpr int NUM_OPS = 64;
constexpr int CONCURRENT = 16;

static std::atomic<int> notified{0};

static void on_complete(union sigval) {
    notified.fetch_add(1, std::memory_order_relaxed);
}

static void run_workload(int fd, const std::string &name, const saio::RequestOptions &opts) {
    std::vector<std::optional<saio::Request>> slots(CONCURRENT);
    notified.store(0, std::memory_order_relaxed);

    auto start = std::chrono::steady_clock::now();
    int submitted = 0;
    int completed = 0;

    while (completed < NUM_OPS) {
        // Fill idle slots
        for (auto &slot : slots) {
            if (submitted >= NUM_OPS) break;
            if (slot && slot->in_flight()) continue;
            off_t offset = (std::rand() % (FILE_SIZE / BUF_SIZE)) * BUF_SIZE;
            slot.emplace(saio::Request::from_owned(fd, offset, saio::Bytes::zeroed(BUF_SIZE), opts));
            slot->submit_read();
            submitted++;
        }

        std::vector<const saio::Request *> pending;
        for (auto &slot : slots) {
            if (slot && slot->in_flight()) pending.push_back(&*slot);
        }
        (void)saio::suspend(pending, 10ms);

        for (auto &slot : slots) {
            if (!slot || !slot->in_flight() || slot->in_progress()) continue;
            try {
                (void)slot->collect_result();
            } catch (const saio::Error &e) {
                std::cerr << "I/O error: " << e.what() << "\n";
            }
            completed++;
        }
    }

    auto elapsed =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    std::cout << "\n" << name << ":\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Elapsed time: " << elapsed << " ms\n";
    std::cout << "  Operations:   " << completed << "\n";
    if (opts.notification().kind() == saio::NotifyKind::Thread) {
        // Callbacks run on their own threads and may trail the completions
        std::this_thread::sleep_for(50ms);
        std::cout << "  Notified:     " << notified.load(std::memory_order_relaxed) << "\n";
    }
}

int main() {
    std::cout << "saio Custom Configuration Examples\n";
    std::cout << "==================================\n\n";

    try {
        // ===================================================================
        // Global tuning: must happen before the first request is submitted
        // ===================================================================
        auto config = saio::Options()
                          .threads(8)     // Worker threads servicing requests
                          .num(128)       // Expected simultaneous requests
                          .idle_time(5);  // Seconds an idle worker lingers
        saio::configure(config);
        std::cout << "Configured: threads=" << config.threads() << " num=" << config.num()
                  << " idle_time=" << config.idle_time() << "s\n";

        int wfd = open(TEST_FILE, O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (wfd < 0) {
            throw saio::Error(errno, "create test file");
        }
        std::vector<char> data(FILE_SIZE, 0);
        if (write(wfd, data.data(), FILE_SIZE) != static_cast<ssize_t>(FILE_SIZE)) {
            int err = errno;
            close(wfd);
            unlink(TEST_FILE);
            throw saio::Error(err, "write test file");
        }
        close(wfd);

        int fd = open(TEST_FILE, O_RDONLY);
        if (fd < 0) {
            unlink(TEST_FILE);
            throw saio::Error(errno, "open test file");
        }

        // ===================================================================
        // Example 1: Default request options
        // ===================================================================
        run_workload(fd, "Default", saio::RequestOptions());

        // ===================================================================
        // Example 2: Lowered priority
        // - Requests yield to others from this process
        // ===================================================================
        run_workload(fd, "Lowered Priority", saio::RequestOptions().priority(4));

        // ===================================================================
        // Example 3: Thread notification
        // - A callback runs on a fresh thread once each request completes
        // ===================================================================
        run_workload(fd, "Thread Notification",
                     saio::RequestOptions().notification(saio::Notification::thread(on_complete)));

        close(fd);
        unlink(TEST_FILE);

        std::cout << "\n======================================\n";
        std::cout << "Configuration Summary:\n";
        std::cout << "- configure(): one-time tuning of the AIO worker pool\n";
        std::cout << "- priority(): lower a request's scheduling priority\n";
        std::cout << "- notification(): be told of completion by signal or thread\n";

        return 0;

    } catch (const saio::Error &e) {
        std::cerr << "saio error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
