/**
 * @file stress_test.cpp
 * @brief Stress test for saio
 *
 * Tests:
 * 1. High concurrency - many outstanding reads per thread
 * 2. Mixed operations - reads, writes, fsync
 * 3. List submission - batches through submit_many()
 * 4. Cancellation under load
 *
 * Run:   ./stress_test [options]
 *
 * Options:
 *   --duration <seconds>   Test duration (default: 10)
 *   --threads <count>      Number of threads (default: 4)
 *   --files <count>        Number of test files (default: 16)
 *   --max-inflight <n>     Outstanding requests per thread (default: 32)
 */

#include <saio.hpp>

#include <iostream>
#include <iomanip>
#include <vector>
#include <thread>
#include <atomic>
#include <optional>
#include <random>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

// =============================================================================
// Configuration
// =============================================================================

struct Config {
    int duration_sec = 10;
    int num_threads = 4;
    int num_files = 16;
    int max_inflight = 32;
    size_t file_size = 8 * 1024 * 1024;  // 8MB per file
    std::string test_dir = "/tmp/saio_stress";
};

// =============================================================================
// Statistics
// =============================================================================

struct Stats {
    std::atomic<long long> ops_submitted{0};
    std::atomic<long long> ops_completed{0};
    std::atomic<long long> ops_failed{0};
    std::atomic<long long> ops_cancelled{0};
    std::atomic<long long> bytes_read{0};
    std::atomic<long long> bytes_written{0};
    std::atomic<long long> short_ops{0};

    void print(double elapsed_sec) const {
        long long total_bytes = bytes_read + bytes_written;
        double throughput_mb = (total_bytes / (1024.0 * 1024.0)) / elapsed_sec;
        double iops = ops_completed / elapsed_sec;

        std::cout << "\n=== Stress Test Results ===\n";
        std::cout << "Duration:          " << std::fixed << std::setprecision(2)
                  << elapsed_sec << " seconds\n";
        std::cout << "Ops submitted:     " << ops_submitted << "\n";
        std::cout << "Ops completed:     " << ops_completed << "\n";
        std::cout << "Ops failed:        " << ops_failed << "\n";
        std::cout << "Ops cancelled:     " << ops_cancelled << "\n";
        std::cout << "Short transfers:   " << short_ops << "\n";
        std::cout << "Bytes read:        " << bytes_read / (1024 * 1024) << " MB\n";
        std::cout << "Bytes written:     " << bytes_written / (1024 * 1024) << " MB\n";
        std::cout << "Throughput:        " << throughput_mb << " MB/s\n";
        std::cout << "IOPS:              " << std::setprecision(0) << iops << "\n";
    }
};

// =============================================================================
// Test File Management
// =============================================================================

class TestFiles {
public:
    TestFiles(const std::string& dir, int count, size_t file_size)
        : dir_(dir), file_size_(file_size)
    {
        mkdir(dir.c_str(), 0755);

        std::vector<char> buf(1024 * 1024);
        std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dist(0, 255);

        for (int i = 0; i < count; i++) {
            std::string path = dir + "/test_" + std::to_string(i) + ".dat";
            paths_.push_back(path);

            int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (fd < 0) {
                throw std::runtime_error("Failed to create test file: " + path);
            }

            for (size_t written = 0; written < file_size; ) {
                for (auto& c : buf) {
                    c = static_cast<char>(dist(gen));
                }
                size_t chunk = std::min(buf.size(), file_size - written);
                if (write(fd, buf.data(), chunk) < 0) {
                    close(fd);
                    throw std::runtime_error("Failed to write test file");
                }
                written += chunk;
            }
            fsync(fd);
            close(fd);
        }

        std::cout << "Created " << count << " test files of "
                  << file_size / (1024 * 1024) << " MB each\n";
    }

    ~TestFiles() {
        for (const auto& path : paths_) {
            unlink(path.c_str());
        }
        rmdir(dir_.c_str());
    }

    std::vector<int> open_all(int flags) const {
        std::vector<int> fds;
        for (const auto& path : paths_) {
            int fd = open(path.c_str(), flags);
            if (fd >= 0) fds.push_back(fd);
        }
        if (fds.empty()) {
            throw std::runtime_error("No test files could be opened");
        }
        return fds;
    }

    size_t file_size() const { return file_size_; }

private:
    std::string dir_;
    size_t file_size_;
    std::vector<std::string> paths_;
};

// =============================================================================
// Request Window
// =============================================================================

/**
 * Fixed set of request slots owned by one thread
 *
 * Slots never move once created, so in-flight requests stay put.  A finished
 * slot's buffer is handed to the next request built in that slot.
 */
class Window {
public:
    explicit Window(size_t slots) : slots_(slots) {}

    size_t size() const { return slots_.size(); }

    std::optional<saio::Request>& slot(size_t i) { return slots_[i]; }

    /// Index of a slot that is free to reuse, or size() if all are busy
    size_t free_slot() const {
        for (size_t i = 0; i < slots_.size(); i++) {
            if (!slots_[i] || !slots_[i]->in_flight()) return i;
        }
        return slots_.size();
    }

    /// Take slot i's buffer for reuse, or a fresh one of the given size
    saio::Bytes take_buffer(size_t i, size_t size) {
        saio::Bytes buf;
        if (slots_[i] && !slots_[i]->in_flight()) {
            saio::Buffer old = slots_[i]->extract_buffer();
            if (old.exclusive()) buf = std::move(*old.exclusive());
        }
        buf.resize(size);
        return buf;
    }

    /// Collect every slot that has finished; returns the number reaped
    size_t reap(Stats& stats) {
        size_t reaped = 0;
        for (auto& req : slots_) {
            if (!req || !req->in_flight() || req->in_progress()) continue;
            try {
                ssize_t n = req->collect_result();
                stats.ops_completed++;
                if (req->opcode() == saio::Opcode::Write) {
                    stats.bytes_written += n;
                } else {
                    stats.bytes_read += n;
                }
                if (n >= 0 && static_cast<size_t>(n) < req->nbytes()) {
                    stats.short_ops++;
                }
            } catch (const saio::Error& e) {
                if (e.is_cancelled()) {
                    stats.ops_cancelled++;
                } else {
                    stats.ops_failed++;
                }
            }
            reaped++;
        }
        return reaped;
    }

    /// Block until something finishes (or the timeout passes), then reap
    size_t wait(Stats& stats, std::chrono::milliseconds timeout) {
        std::vector<const saio::Request*> pending;
        for (auto& req : slots_) {
            if (req && req->in_flight()) pending.push_back(&*req);
        }
        if (pending.empty()) return 0;
        (void)saio::suspend(pending, timeout);
        return reap(stats);
    }

    void drain(Stats& stats) {
        while (in_flight() > 0) {
            wait(stats, 100ms);
        }
    }

    size_t in_flight() const {
        size_t n = 0;
        for (auto& req : slots_) {
            if (req && req->in_flight()) n++;
        }
        return n;
    }

private:
    std::vector<std::optional<saio::Request>> slots_;
};

static void report(const char* name, Clock::time_point start, const Stats& stats) {
    auto elapsed = std::chrono::duration<double>(Clock::now() - start).count();
    std::cout << name << " completed in " << std::fixed << std::setprecision(2)
              << elapsed << "s, " << stats.ops_completed << " ops so far\n";
}

// =============================================================================
// Stress Test: High Concurrency Reads
// =============================================================================

void test_high_concurrency_reads(const TestFiles& files, Stats& stats,
                                 const Config& config)
{
    std::cout << "\n--- Test: High Concurrency Reads ---\n";

    const size_t buf_size = 64 * 1024;
    std::vector<int> fds = files.open_all(O_RDONLY);
    auto start = Clock::now();
    auto end_time = start + std::chrono::seconds(config.duration_sec);

    std::vector<std::thread> workers;
    for (int t = 0; t < config.num_threads; t++) {
        workers.emplace_back([&, seed = std::random_device{}()]() {
            std::mt19937 gen(seed);
            std::uniform_int_distribution<size_t> fd_dist(0, fds.size() - 1);
            std::uniform_int_distribution<off_t> off_dist(0, files.file_size() - buf_size);
            Window window(config.max_inflight);

            while (Clock::now() < end_time) {
                size_t i = window.free_slot();
                if (i == window.size()) {
                    window.wait(stats, 10ms);
                    continue;
                }
                try {
                    off_t offset = (off_dist(gen) / 4096) * 4096;
                    saio::Bytes buf = window.take_buffer(i, buf_size);
                    window.slot(i).emplace(saio::Request::from_owned(
                        fds[fd_dist(gen)], offset, std::move(buf),
                        saio::RequestOptions().opcode(saio::Opcode::Read)));
                    window.slot(i)->submit_read();
                    stats.ops_submitted++;
                } catch (const saio::Error& e) {
                    stats.ops_failed++;
                    if (e.is_again()) window.wait(stats, 10ms);
                }
            }
            window.drain(stats);
        });
    }
    for (auto& w : workers) w.join();
    for (int fd : fds) close(fd);

    report("High concurrency reads", start, stats);
}

// =============================================================================
// Stress Test: Mixed Read/Write Operations
// =============================================================================

void test_mixed_operations(const TestFiles& files, Stats& stats, const Config& config)
{
    std::cout << "\n--- Test: Mixed Read/Write/Fsync Operations ---\n";

    const size_t buf_size = 32 * 1024;
    std::vector<int> fds = files.open_all(O_RDWR);
    auto start = Clock::now();
    auto end_time = start + std::chrono::seconds(config.duration_sec);

    std::vector<std::thread> workers;
    for (int t = 0; t < config.num_threads; t++) {
        workers.emplace_back([&, seed = std::random_device{}()]() {
            std::mt19937 gen(seed);
            std::uniform_int_distribution<size_t> fd_dist(0, fds.size() - 1);
            std::uniform_int_distribution<off_t> off_dist(0, files.file_size() - buf_size);
            std::uniform_int_distribution<int> op_dist(0, 99);
            Window window(config.max_inflight);

            while (Clock::now() < end_time) {
                size_t i = window.free_slot();
                if (i == window.size()) {
                    window.wait(stats, 10ms);
                    continue;
                }
                try {
                    int fd = fds[fd_dist(gen)];
                    off_t offset = (off_dist(gen) / 4096) * 4096;
                    int op = op_dist(gen);

                    if (op < 60) {
                        // 60% reads
                        saio::Bytes buf = window.take_buffer(i, buf_size);
                        window.slot(i).emplace(saio::Request::from_owned(
                            fd, offset, std::move(buf),
                            saio::RequestOptions().opcode(saio::Opcode::Read)));
                        window.slot(i)->submit_read();
                    } else if (op < 95) {
                        // 35% writes
                        saio::Bytes buf = window.take_buffer(i, buf_size);
                        std::memset(buf.data(), 'W', buf.size());
                        window.slot(i).emplace(saio::Request::from_owned(
                            fd, offset, std::move(buf),
                            saio::RequestOptions().opcode(saio::Opcode::Write)));
                        window.slot(i)->submit_write();
                    } else {
                        // 5% fsync
                        window.slot(i).emplace(saio::Request::from_fd(fd));
                        window.slot(i)->submit_fsync();
                    }
                    stats.ops_submitted++;
                } catch (const saio::Error& e) {
                    stats.ops_failed++;
                    if (e.is_again()) window.wait(stats, 10ms);
                }
            }
            window.drain(stats);
        });
    }
    for (auto& w : workers) w.join();
    for (int fd : fds) close(fd);

    report("Mixed operations", start, stats);
}

// =============================================================================
// Stress Test: List Submission
// =============================================================================

void test_list_submission(const TestFiles& files, Stats& stats, const Config& config)
{
#if SAIO_HAVE_LIO_LISTIO
    std::cout << "\n--- Test: List Submission ---\n";

    const size_t buf_size = 16 * 1024;
    const size_t batch = 8;
    std::vector<int> fds = files.open_all(O_RDONLY);
    auto start = Clock::now();
    auto end_time = start + std::chrono::seconds(config.duration_sec);

    std::vector<std::thread> workers;
    for (int t = 0; t < config.num_threads; t++) {
        workers.emplace_back([&, t, seed = std::random_device{}()]() {
            std::mt19937 gen(seed);
            std::uniform_int_distribution<size_t> fd_dist(0, fds.size() - 1);
            std::uniform_int_distribution<off_t> off_dist(0, files.file_size() - buf_size);
            Window window(batch);
            // Alternate blocking and non-blocking batches across threads
            saio::LioMode mode = (t % 2 == 0) ? saio::LioMode::Wait : saio::LioMode::NoWait;

            while (Clock::now() < end_time) {
                std::vector<saio::Request*> list;
                for (size_t i = 0; i < batch; i++) {
                    off_t offset = (off_dist(gen) / 4096) * 4096;
                    saio::Bytes buf = window.take_buffer(i, buf_size);
                    window.slot(i).emplace(saio::Request::from_owned(
                        fds[fd_dist(gen)], offset, std::move(buf),
                        saio::RequestOptions().opcode(saio::Opcode::Read)));
                    list.push_back(&*window.slot(i));
                }
                try {
                    saio::submit_many(mode, list);
                    stats.ops_submitted += batch;
                } catch (const saio::Error&) {
                    stats.ops_failed++;
                }
                window.drain(stats);
            }
        });
    }
    for (auto& w : workers) w.join();
    for (int fd : fds) close(fd);

    report("List submission", start, stats);
#else
    (void)files;
    (void)stats;
    (void)config;
    std::cout << "\n--- Test: List Submission (not available, skipped) ---\n";
#endif
}

// =============================================================================
// Stress Test: Cancellation Under Load
// =============================================================================

void test_cancellation(const TestFiles& files, Stats& stats, const Config& config)
{
    std::cout << "\n--- Test: Cancellation Under Load ---\n";

    const size_t buf_size = 4096;
    std::vector<int> fds = files.open_all(O_RDONLY);
    auto start = Clock::now();
    auto end_time = start + std::chrono::seconds(config.duration_sec);

    std::vector<std::thread> workers;
    for (int t = 0; t < config.num_threads; t++) {
        workers.emplace_back([&, t, seed = std::random_device{}()]() {
            std::mt19937 gen(seed);
            std::uniform_int_distribution<off_t> off_dist(0, files.file_size() - buf_size);
            int fd = fds[t % fds.size()];
            Window window(config.max_inflight);

            while (Clock::now() < end_time) {
                for (size_t i = 0; i < window.size(); i++) {
                    off_t offset = (off_dist(gen) / 4096) * 4096;
                    saio::Bytes buf = window.take_buffer(i, buf_size);
                    window.slot(i).emplace(saio::Request::from_owned(fd, offset, std::move(buf)));
                    try {
                        window.slot(i)->submit_read();
                        stats.ops_submitted++;
                    } catch (const saio::Error&) {
                        stats.ops_failed++;
                    }
                }

                // Cancel half individually, the rest through the descriptor
                for (size_t i = 0; i < window.size() / 2; i++) {
                    if (window.slot(i)->in_flight()) {
                        (void)window.slot(i)->cancel();
                    }
                }
                try {
                    (void)saio::cancel_all(fd);
                } catch (const saio::Error&) {
                    stats.ops_failed++;
                }
                window.drain(stats);
            }
        });
    }
    for (auto& w : workers) w.join();
    for (int fd : fds) close(fd);

    report("Cancellation", start, stats);
}

// =============================================================================
// Main
// =============================================================================

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --duration <seconds>   Test duration (default: 10)\n";
    std::cerr << "  --threads <count>      Number of threads (default: 4)\n";
    std::cerr << "  --files <count>        Number of test files (default: 16)\n";
    std::cerr << "  --max-inflight <n>     Outstanding requests per thread (default: 32)\n";
    std::cerr << "  --quick                Quick test (2 seconds per test)\n";
    std::cerr << "  --help                 Show this help\n";
}

int main(int argc, char** argv) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--duration" && i + 1 < argc) {
            config.duration_sec = std::stoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            config.num_threads = std::stoi(argv[++i]);
        } else if (arg == "--files" && i + 1 < argc) {
            config.num_files = std::stoi(argv[++i]);
        } else if (arg == "--max-inflight" && i + 1 < argc) {
            config.max_inflight = std::stoi(argv[++i]);
        } else if (arg == "--quick") {
            config.duration_sec = 2;
            config.num_files = 4;
            config.file_size = 4 * 1024 * 1024;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config.num_threads < 1 || config.num_files < 1 || config.max_inflight < 1) {
        print_usage(argv[0]);
        return 1;
    }

    std::cout << "=== saio Stress Test ===\n";
    std::cout << "Duration:     " << config.duration_sec << " seconds per test\n";
    std::cout << "Threads:      " << config.num_threads << "\n";
    std::cout << "Test files:   " << config.num_files << "\n";
    std::cout << "Max inflight: " << config.max_inflight << " per thread\n";
    std::cout << "File size:    " << config.file_size / (1024 * 1024) << " MB\n";

    std::atomic<long long> warnings{0};
    saio::set_log_handler([&warnings](saio::LogLevel level, std::string_view msg) {
        if (level <= saio::LogLevel::Warning) {
            warnings++;
            std::cerr << "[saio " << saio::log_level_name(level) << "] " << msg << "\n";
        }
    });

    try {
        saio::configure(saio::Options()
                            .threads(config.num_threads * 4)
                            .num(config.num_threads * config.max_inflight));

        std::cout << "\nCreating test files...\n";
        TestFiles files(config.test_dir, config.num_files, config.file_size);
        Stats stats;

        auto total_start = Clock::now();

        test_high_concurrency_reads(files, stats, config);
        test_mixed_operations(files, stats, config);
        test_list_submission(files, stats, config);
        test_cancellation(files, stats, config);

        auto total_elapsed = std::chrono::duration<double>(Clock::now() - total_start).count();
        stats.print(total_elapsed);
        saio::clear_log_handler();

        if (stats.ops_failed > 0) {
            std::cout << "\n*** WARNING: " << stats.ops_failed << " operations failed ***\n";
        }
        if (warnings > 0) {
            std::cout << "\n*** FAILED: " << warnings << " library warnings ***\n";
            return 1;
        }

        std::cout << "\n=== STRESS TEST PASSED ===\n";
        return 0;

    } catch (const saio::Error& e) {
        std::cerr << "saio error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
