/**
 * @file bulk_reader.cpp
 * @brief High-throughput bulk file reader example
 *
 * Demonstrates reading many files concurrently.  Files are read in batches;
 * each batch is queued with a single submit_many() call where the platform
 * offers one, and reaped with suspend().
 *
 * Usage: ./bulk_reader <directory>
 */

#include <saio.hpp>

#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <memory>
#include <filesystem>
#include <chrono>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

constexpr size_t MAX_FILES = 10000;
constexpr size_t READ_SIZE = 256 * 1024;  // 256KB per file
constexpr size_t BATCH_SIZE = 64;

// Per-file state; heap-allocated so the request never moves while queued
struct FileContext {
    int fd;
    saio::Request request;

    FileContext(int f, saio::Request req) : fd(f), request(std::move(req)) {}

    ~FileContext() {
        if (fd >= 0) {
            close(fd);
        }
    }
};

struct Totals {
    long long files = 0;
    long long bytes = 0;
    long long errors = 0;
};

static void submit_batch(std::vector<std::unique_ptr<FileContext>>& batch, Totals& totals) {
    std::vector<saio::Request*> list;
    for (auto& f : batch) list.push_back(&f->request);

#if SAIO_HAVE_LIO_LISTIO
    try {
        saio::submit_many(saio::LioMode::NoWait, list);
        return;
    } catch (const saio::Error& e) {
        std::cerr << "\nList submission failed: " << e.what() << "\n";
    }
#endif

    // Submit one by one whatever the list call did not queue
    for (auto* req : list) {
        if (req->in_flight()) continue;
        try {
            req->submit_read();
        } catch (const saio::Error&) {
            totals.errors++;
        }
    }
}

static void reap_batch(std::vector<std::unique_ptr<FileContext>>& batch, Totals& totals) {
    for (;;) {
        std::vector<const saio::Request*> pending;
        for (auto& f : batch) {
            if (f->request.in_flight()) pending.push_back(&f->request);
        }
        if (pending.empty()) break;

        (void)saio::suspend(pending, 100ms);

        for (auto& f : batch) {
            saio::Request& req = f->request;
            if (!req.in_flight() || req.in_progress()) continue;
            try {
                totals.bytes += req.collect_result();
            } catch (const saio::Error&) {
                totals.errors++;
            }
            totals.files++;
        }
    }
    batch.clear();
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <directory>\n";
        std::cerr << "\nReads all regular files in a directory using async I/O.\n";
        return 1;
    }

    const std::string dirname = argv[1];

    try {
        if (!fs::is_directory(dirname)) {
            std::cerr << "Not a directory: " << dirname << "\n";
            return 1;
        }

        std::cout << "Scanning directory '" << dirname << "'...\n";
        auto start = Clock::now();

        Totals totals;
        std::vector<std::unique_ptr<FileContext>> batch;
        size_t seen = 0;

        for (const auto& entry : fs::directory_iterator(dirname)) {
            if (seen >= MAX_FILES) break;
            if (!entry.is_regular_file()) continue;

            int fd = open(entry.path().c_str(), O_RDONLY);
            if (fd < 0) continue;  // Skip files we can't open
            seen++;

            auto opts = saio::RequestOptions().opcode(saio::Opcode::Read);
            batch.push_back(std::make_unique<FileContext>(
                fd, saio::Request::from_owned(fd, 0, saio::Bytes::zeroed(READ_SIZE), opts)));

            if (batch.size() == BATCH_SIZE) {
                submit_batch(batch, totals);
                reap_batch(batch, totals);

                auto elapsed = std::chrono::duration<double>(Clock::now() - start).count();
                double mb_read = totals.bytes / (1024.0 * 1024.0);
                std::cout << "\rProgress: " << totals.files << " files, "
                          << std::fixed << std::setprecision(2)
                          << mb_read << " MB, " << mb_read / elapsed << " MB/s" << std::flush;
            }
        }
        if (!batch.empty()) {
            submit_batch(batch, totals);
            reap_batch(batch, totals);
        }

        if (seen == 0) {
            std::cout << "No files found to read.\n";
            return 1;
        }

        std::cout << "\n\n=== Final Results ===\n";

        double total_elapsed = std::chrono::duration<double>(Clock::now() - start).count();
        double mb_total = totals.bytes / (1024.0 * 1024.0);

        std::cout << "Files read:       " << totals.files << "\n";
        std::cout << "Total bytes:      " << std::fixed << std::setprecision(2)
                  << mb_total << " MB\n";
        std::cout << "Errors:           " << totals.errors << "\n";
        std::cout << "Elapsed time:     " << total_elapsed << " seconds\n";
        std::cout << "Average speed:    " << mb_total / total_elapsed << " MB/s\n";

        std::cout << "\nDone!\n";
        return 0;

    } catch (const saio::Error& e) {
        std::cerr << "saio error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
