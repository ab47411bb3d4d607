/**
 * @file saiocp.cpp
 * @brief saiocp - async pipelined file copy built on saio
 *
 * A cp replacement that keeps a fixed number of chunk-sized reads and writes
 * in flight through POSIX AIO.  Each pipeline slot owns its buffer: a read
 * fills it, the same bytes are handed to a write, and the buffer returns to
 * the slot once the write has been collected.  Supports single file,
 * multi-file, and recursive directory copy with cross-file pipelining.
 *
 * Usage: saiocp [OPTIONS] SOURCE... DEST
 */

#include <saio.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <getopt.h>
#include <libgen.h>
#include <limits.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

using namespace std::chrono_literals;

// ============================================================================
// Constants
// ============================================================================

static constexpr size_t DEFAULT_CHUNK_SIZE = 256 * 1024; // 256 KiB
static constexpr int DEFAULT_PIPELINE = 8;
static constexpr int MAX_PIPELINE = 64;
static constexpr uint64_t PROGRESS_INTERVAL_MS = 200;
static constexpr int NFTW_MAX_FDS = 64;

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    std::vector<const char *> sources;
    const char *dest = nullptr;
    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    int pipeline_depth = DEFAULT_PIPELINE;
    int aio_threads = 0; // 0 = derive from pipeline depth
    bool recursive = false;
    bool quiet = false;
    bool no_progress = false;
    bool no_fsync = false;
    bool preserve = false;
    bool verbose = false;
    bool keep_partial = false;
};

// ============================================================================
// File task queue
// ============================================================================

struct FileTask {
    std::string src_path;
    std::string dst_path;
    off_t file_size = 0;
    mode_t mode = 0;
    int src_fd = -1;
    int dst_fd = -1;
    off_t read_offset = 0;
    off_t bytes_written = 0;
    int active_ops = 0;
    bool reads_done = false;
    bool done = false;
};

struct TaskQueue {
    std::vector<FileTask> tasks;
    size_t current = 0; // index of next task needing reads
    int completed_files = 0;
    off_t total_bytes = 0;
    off_t total_written = 0;

    void push(FileTask task) {
        total_bytes += task.file_size;
        tasks.push_back(std::move(task));
    }

    int total_files() const { return static_cast<int>(tasks.size()); }
};

// ============================================================================
// Pipeline slots
// ============================================================================

enum class SlotState { Free, Reading, Writing };

struct Slot {
    std::optional<saio::Request> req;
    saio::Bytes buf; // held here while no request owns it
    off_t offset = 0;
    size_t bytes = 0;
    SlotState state = SlotState::Free;
    size_t task_idx = 0;
};

// A destination fsync; closes both descriptors once collected
struct SyncOp {
    saio::Request req;
    size_t task_idx;
    int src_fd;
    int dst_fd;
};

// ============================================================================
// Global state for signal handling
// ============================================================================

static volatile sig_atomic_t g_interrupted = 0;
static struct timespec g_start_time;
static uint64_t g_last_progress_ns = 0;

static void sigint_handler(int /*sig*/) {
    g_interrupted = 1;
}

// ============================================================================
// Size parsing
// ============================================================================

static ssize_t parse_size(const char *str) {
    char *endp;
    double val = strtod(str, &endp);
    if (endp == str || val < 0) return -1;

    switch (*endp) {
    case 'G':
    case 'g':
        val *= 1024.0 * 1024.0 * 1024.0;
        break;
    case 'M':
    case 'm':
        val *= 1024.0 * 1024.0;
        break;
    case 'K':
    case 'k':
        val *= 1024.0;
        break;
    case '\0':
        break;
    default:
        return -1;
    }

    if (val > static_cast<double>(SSIZE_MAX)) return -1;
    return static_cast<ssize_t>(val);
}

// ============================================================================
// Formatting helpers
// ============================================================================

static void format_bytes(char *buf, size_t bufsz, double bytes) {
    if (bytes >= 1024.0 * 1024.0 * 1024.0)
        snprintf(buf, bufsz, "%.1f GiB", bytes / (1024.0 * 1024.0 * 1024.0));
    else if (bytes >= 1024.0 * 1024.0) snprintf(buf, bufsz, "%.1f MiB", bytes / (1024.0 * 1024.0));
    else if (bytes >= 1024.0) snprintf(buf, bufsz, "%.1f KiB", bytes / 1024.0);
    else snprintf(buf, bufsz, "%.0f B", bytes);
}

static void format_rate(char *buf, size_t bufsz, double bps) {
    if (bps >= 1024.0 * 1024.0 * 1024.0)
        snprintf(buf, bufsz, "%.1f GiB/s", bps / (1024.0 * 1024.0 * 1024.0));
    else if (bps >= 1024.0 * 1024.0) snprintf(buf, bufsz, "%.1f MiB/s", bps / (1024.0 * 1024.0));
    else if (bps >= 1024.0) snprintf(buf, bufsz, "%.1f KiB/s", bps / 1024.0);
    else snprintf(buf, bufsz, "%.0f B/s", bps);
}

static double elapsed_since_start() {
    struct timespec now;
    clock_gettime(CLOCK_MONOTONIC, &now);
    return static_cast<double>(now.tv_sec - g_start_time.tv_sec) +
           static_cast<double>(now.tv_nsec - g_start_time.tv_nsec) / 1e9;
}

// ============================================================================
// Progress display
// ============================================================================

static void progress_update(const Config &config, const TaskQueue &queue, bool final) {
    if (config.quiet || config.no_progress) return;
    if (!final && !isatty(STDERR_FILENO)) return;

    struct timespec now;
    clock_gettime(CLOCK_MONOTONIC, &now);
    uint64_t now_ns =
        static_cast<uint64_t>(now.tv_sec) * 1000000000ULL + static_cast<uint64_t>(now.tv_nsec);

    if (!final && (now_ns - g_last_progress_ns) < PROGRESS_INTERVAL_MS * 1000000ULL) return;
    g_last_progress_ns = now_ns;

    double elapsed = elapsed_since_start();
    double done = static_cast<double>(queue.total_written);
    double total = static_cast<double>(queue.total_bytes);
    double pct = (total > 0) ? done / total * 100.0 : 100.0;
    double rate = (elapsed > 0.01) ? done / elapsed : 0.0;

    char done_str[32], total_str[32], rate_str[32];
    format_bytes(done_str, sizeof(done_str), done);
    format_bytes(total_str, sizeof(total_str), total);
    format_rate(rate_str, sizeof(rate_str), rate);

    int bar_width = 30;
    int filled = (total > 0) ? static_cast<int>(pct / 100.0 * bar_width) : bar_width;
    if (filled > bar_width) filled = bar_width;

    char bar[64];
    int i;
    for (i = 0; i < filled && i < bar_width; i++) bar[i] = '=';
    if (filled < bar_width) {
        bar[filled] = '>';
        for (i = filled + 1; i < bar_width; i++) bar[i] = ' ';
    }
    bar[bar_width] = '\0';

    char eta[32] = "";
    if (rate > 0 && total > done) {
        double remaining = (total - done) / rate;
        int mins = static_cast<int>(remaining / 60.0);
        int secs = static_cast<int>(remaining) % 60;
        snprintf(eta, sizeof(eta), "ETA %d:%02d", mins, secs);
    }

    fprintf(stderr, "\r  %s / %s  [%s]  %3.0f%%  %s  %s   ", done_str, total_str, bar, pct,
            rate_str, eta);

    if (final) fprintf(stderr, "\n");
}

// ============================================================================
// Path helpers
// ============================================================================

static std::string path_join(const char *dir, const char *name) {
    std::string d(dir);
    while (d.size() > 1 && d.back() == '/') d.pop_back();
    d += '/';
    d += name;
    return d;
}

static std::string remap_path(const char *src_root, const char *dst_root, const char *fpath) {
    size_t rootlen = strlen(src_root);
    while (rootlen > 1 && src_root[rootlen - 1] == '/') rootlen--;
    const char *suffix = fpath + rootlen;
    if (*suffix == '/') suffix++;

    std::string d(dst_root);
    while (d.size() > 1 && d.back() == '/') d.pop_back();
    d += '/';
    d += suffix;
    return d;
}

static const char *errstr(int err) {
    static thread_local std::string msg;
    msg = std::generic_category().message(err);
    return msg.c_str();
}

// ============================================================================
// Task list building
// ============================================================================

struct WalkContext {
    const char *src_root;
    const char *dst_root;
    TaskQueue *queue;
    const Config *config;
    int errors;
};

static WalkContext *g_walk_ctx; // nftw has no user data argument

static int nftw_callback(const char *fpath, const struct stat *sb, int typeflag,
                         struct FTW * /*ftwbuf*/) {
    WalkContext *wc = g_walk_ctx;

    if (typeflag == FTW_D) {
        auto dst = remap_path(wc->src_root, wc->dst_root, fpath);
        if (mkdir(dst.c_str(), sb->st_mode & 07777) != 0 && errno != EEXIST) {
            fprintf(stderr, "saiocp: cannot create directory '%s': %s\n", dst.c_str(),
                    errstr(errno));
            wc->errors++;
        }
        return 0;
    }

    if (typeflag == FTW_F) {
        FileTask task;
        task.src_path = fpath;
        task.dst_path = remap_path(wc->src_root, wc->dst_root, fpath);
        task.file_size = sb->st_size;
        task.mode = sb->st_mode;
        wc->queue->push(std::move(task));
        return 0;
    }

    if (typeflag != FTW_SL) {
        if (!wc->config->quiet) fprintf(stderr, "saiocp: skipping special file: %s\n", fpath);
    }
    return 0;
}

static int build_recursive(const char *src, const char *dst, TaskQueue &queue,
                           const Config &config) {
    WalkContext wc = {src, dst, &queue, &config, 0};
    g_walk_ctx = &wc;
    if (nftw(src, nftw_callback, NFTW_MAX_FDS, 0) != 0) {
        fprintf(stderr, "saiocp: cannot walk '%s': %s\n", src, errstr(errno));
        return -1;
    }
    return wc.errors ? -1 : 0;
}

static int build_task_list(const Config &config, TaskQueue &queue) {
    struct stat dst_st;
    bool dst_is_dir = (stat(config.dest, &dst_st) == 0 && S_ISDIR(dst_st.st_mode));

    if (config.sources.size() > 1 && !dst_is_dir) {
        fprintf(stderr, "saiocp: target '%s' is not a directory\n", config.dest);
        return -1;
    }

    for (const char *src : config.sources) {
        struct stat src_st;
        if (stat(src, &src_st) != 0) {
            fprintf(stderr, "saiocp: cannot stat '%s': %s\n", src, errstr(errno));
            return -1;
        }

        std::string src_copy(src);
        const char *base = basename(src_copy.data());

        if (S_ISDIR(src_st.st_mode)) {
            if (!config.recursive) {
                fprintf(stderr, "saiocp: -r not specified; omitting directory '%s'\n", src);
                return -1;
            }
            // saiocp -r src/ existing_dir/ -> existing_dir/src/...
            std::string dst_dir = dst_is_dir ? path_join(config.dest, base) : config.dest;
            if (mkdir(dst_dir.c_str(), src_st.st_mode & 07777) != 0 && errno != EEXIST) {
                fprintf(stderr, "saiocp: cannot create directory '%s': %s\n", dst_dir.c_str(),
                        errstr(errno));
                return -1;
            }
            if (build_recursive(src, dst_dir.c_str(), queue, config) != 0) return -1;
        } else if (S_ISREG(src_st.st_mode)) {
            std::string dst_path = dst_is_dir ? path_join(config.dest, base) : config.dest;

            struct stat check_st;
            if (stat(dst_path.c_str(), &check_st) == 0 && src_st.st_dev == check_st.st_dev &&
                src_st.st_ino == check_st.st_ino) {
                fprintf(stderr, "saiocp: '%s' and '%s' are the same file\n", src,
                        dst_path.c_str());
                return -1;
            }

            FileTask task;
            task.src_path = src;
            task.dst_path = std::move(dst_path);
            task.file_size = src_st.st_size;
            task.mode = src_st.st_mode;
            queue.push(std::move(task));
        } else {
            fprintf(stderr, "saiocp: skipping special file: %s\n", src);
        }
    }

    if (queue.tasks.empty()) {
        fprintf(stderr, "saiocp: no files to copy\n");
        return -1;
    }
    return 0;
}

// ============================================================================
// Copy context
// ============================================================================

class CopyContext {
  public:
    CopyContext(const Config &config, TaskQueue &queue)
        : config_(config), queue_(queue), slots_(static_cast<size_t>(config.pipeline_depth)) {
        for (auto &slot : slots_) {
            slot.buf = saio::Bytes::zeroed(config.chunk_size);
        }
    }

    int copy_pipeline();

  private:
    int open_task(FileTask &task);
    void finish_task(size_t task_idx);
    void close_task(FileTask &task);
    void fill_slot(size_t slot_idx);
    void reap();
    void on_read_complete(Slot &slot, ssize_t result);
    void on_write_complete(Slot &slot, ssize_t result);
    void fail(int err);
    bool all_tasks_done() const;
    size_t in_flight() const;
    void wait();

    const Config &config_;
    TaskQueue &queue_;
    std::vector<Slot> slots_;
    std::vector<std::unique_ptr<SyncOp>> syncs_;
    int error_ = 0;
};

void CopyContext::fail(int err) {
    if (error_ == 0) error_ = err;
}

int CopyContext::open_task(FileTask &task) {
    task.src_fd = open(task.src_path.c_str(), O_RDONLY);
    if (task.src_fd < 0) {
        fprintf(stderr, "saiocp: cannot open '%s': %s\n", task.src_path.c_str(), errstr(errno));
        return -1;
    }

    task.dst_fd = open(task.dst_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, task.mode & 07777);
    if (task.dst_fd < 0) {
        fprintf(stderr, "saiocp: cannot create '%s': %s\n", task.dst_path.c_str(),
                errstr(errno));
        close(task.src_fd);
        task.src_fd = -1;
        return -1;
    }

    // Pre-allocate destination (best-effort)
    if (task.file_size > 0) (void)posix_fallocate(task.dst_fd, 0, task.file_size);
    (void)fchmod(task.dst_fd, task.mode & 07777);
    return 0;
}

void CopyContext::close_task(FileTask &task) {
    if (task.src_fd >= 0) close(task.src_fd);
    if (task.dst_fd >= 0) close(task.dst_fd);
    task.src_fd = -1;
    task.dst_fd = -1;
    task.done = true;
}

void CopyContext::finish_task(size_t task_idx) {
    FileTask &task = queue_.tasks[task_idx];
    queue_.completed_files++;

    if (config_.preserve && task.dst_fd >= 0) {
        struct stat src_st;
        if (fstat(task.src_fd, &src_st) == 0) {
            struct timespec times[2] = {src_st.st_atim, src_st.st_mtim};
            (void)futimens(task.dst_fd, times);
        }
    }

    if (config_.no_fsync || task.dst_fd < 0) {
        close_task(task);
        return;
    }

#if defined(O_DSYNC)
    constexpr saio::FsyncMode mode = saio::FsyncMode::DataSync;
#else
    constexpr saio::FsyncMode mode = saio::FsyncMode::Sync;
#endif
    auto op = std::make_unique<SyncOp>(
        SyncOp{saio::Request::from_fd(task.dst_fd), task_idx, task.src_fd, task.dst_fd});
    try {
        op->req.submit_fsync(mode);
        task.src_fd = -1;
        task.dst_fd = -1;
        syncs_.push_back(std::move(op));
    } catch (const saio::Error &) {
        // Fall back to a synchronous flush
        if (fdatasync(task.dst_fd) != 0) {
            fprintf(stderr, "saiocp: fsync failed for '%s': %s\n", task.dst_path.c_str(),
                    errstr(errno));
            fail(errno);
        }
        close_task(task);
    }
}

void CopyContext::on_read_complete(Slot &slot, ssize_t result) {
    FileTask &task = queue_.tasks[slot.task_idx];
    saio::Buffer buf = slot.req->extract_buffer();
    slot.buf = std::move(*buf.exclusive());

    if (result <= 0) {
        if (result == 0) {
            fprintf(stderr, "saiocp: '%s' shrank during copy\n", task.src_path.c_str());
            fail(EIO);
        }
        slot.state = SlotState::Free;
        task.active_ops--;
        return;
    }

    // Write back exactly the bytes that were read
    slot.bytes = static_cast<size_t>(result);
    slot.buf.resize(slot.bytes);
    slot.req.emplace(saio::Request::from_owned(task.dst_fd, slot.offset, std::move(slot.buf)));
    try {
        slot.req->submit_write();
        slot.state = SlotState::Writing;
    } catch (const saio::Error &e) {
        fprintf(stderr, "saiocp: write submit failed on '%s': %s\n", task.dst_path.c_str(),
                e.what());
        fail(e.code());
        slot.buf = std::move(*slot.req->extract_buffer().exclusive());
        slot.state = SlotState::Free;
        task.active_ops--;
    }
}

void CopyContext::on_write_complete(Slot &slot, ssize_t result) {
    size_t task_idx = slot.task_idx;
    FileTask &task = queue_.tasks[task_idx];
    saio::Buffer buf = slot.req->extract_buffer();
    slot.buf = std::move(*buf.exclusive());

    if (result < 0) {
        // Already reported by reap()
    } else if (static_cast<size_t>(result) != slot.bytes) {
        fprintf(stderr, "saiocp: short write on '%s'\n", task.dst_path.c_str());
        fail(EIO);
    } else {
        task.bytes_written += result;
        queue_.total_written += result;
    }

    slot.state = SlotState::Free;
    task.active_ops--;

    if (task.reads_done && task.active_ops == 0 && !task.done) {
        finish_task(task_idx);
    }
}

void CopyContext::fill_slot(size_t slot_idx) {
    // Find a task that needs reads
    size_t idx = queue_.current;
    while (idx < queue_.tasks.size()) {
        auto &t = queue_.tasks[idx];
        if (!t.reads_done && !t.done) break;
        idx++;
    }
    if (idx >= queue_.tasks.size()) return; // all reads submitted
    queue_.current = idx;

    FileTask &task = queue_.tasks[idx];

    if (task.src_fd < 0) {
        if (open_task(task) != 0) {
            fail(EIO);
            task.reads_done = true;
            task.done = true;
            queue_.completed_files++;
            queue_.current = idx + 1;
            return;
        }
        if (task.file_size == 0) {
            task.reads_done = true;
            queue_.current = idx + 1;
            finish_task(idx);
            fill_slot(slot_idx);
            return;
        }
    }

    size_t chunk = config_.chunk_size;
    if (task.read_offset + static_cast<off_t>(chunk) > task.file_size)
        chunk = static_cast<size_t>(task.file_size - task.read_offset);

    Slot &slot = slots_[slot_idx];
    slot.offset = task.read_offset;
    slot.bytes = chunk;
    slot.task_idx = idx;
    slot.buf.resize(chunk);
    slot.req.emplace(saio::Request::from_owned(task.src_fd, slot.offset, std::move(slot.buf)));

    try {
        slot.req->submit_read();
    } catch (const saio::Error &e) {
        fprintf(stderr, "saiocp: read submit failed on '%s': %s\n", task.src_path.c_str(),
                e.what());
        fail(e.code());
        slot.buf = std::move(*slot.req->extract_buffer().exclusive());
        return;
    }

    slot.state = SlotState::Reading;
    task.active_ops++;
    task.read_offset += static_cast<off_t>(chunk);
    if (task.read_offset >= task.file_size) {
        task.reads_done = true;
        queue_.current = idx + 1;
    }
}

void CopyContext::reap() {
    for (auto &slot : slots_) {
        if (slot.state == SlotState::Free || slot.req->in_progress()) continue;

        ssize_t result;
        try {
            result = slot.req->collect_result();
        } catch (const saio::Error &e) {
            const FileTask &task = queue_.tasks[slot.task_idx];
            fprintf(stderr, "saiocp: %s error on '%s': %s\n",
                    slot.state == SlotState::Reading ? "read" : "write",
                    (slot.state == SlotState::Reading ? task.src_path : task.dst_path).c_str(),
                    errstr(e.code()));
            fail(e.code());
            result = -1;
        }

        if (slot.state == SlotState::Reading) {
            on_read_complete(slot, result);
        } else {
            on_write_complete(slot, result);
        }
    }

    for (auto it = syncs_.begin(); it != syncs_.end();) {
        SyncOp &op = **it;
        if (op.req.in_progress()) {
            ++it;
            continue;
        }
        try {
            (void)op.req.collect_result();
        } catch (const saio::Error &e) {
            fprintf(stderr, "saiocp: fsync failed for '%s': %s\n",
                    queue_.tasks[op.task_idx].dst_path.c_str(), errstr(e.code()));
            fail(e.code());
        }
        close(op.src_fd);
        close(op.dst_fd);
        queue_.tasks[op.task_idx].done = true;
        it = syncs_.erase(it);
    }
}

bool CopyContext::all_tasks_done() const {
    for (const auto &t : queue_.tasks) {
        if (!t.done) return false;
    }
    return true;
}

size_t CopyContext::in_flight() const {
    size_t n = syncs_.size();
    for (const auto &slot : slots_) {
        if (slot.state != SlotState::Free) n++;
    }
    return n;
}

void CopyContext::wait() {
    std::vector<const saio::Request *> pending;
    for (const auto &slot : slots_) {
        if (slot.state != SlotState::Free) pending.push_back(&*slot.req);
    }
    for (const auto &op : syncs_) {
        pending.push_back(&op->req);
    }
    try {
        (void)saio::suspend(pending, 100ms);
    } catch (const saio::Error &e) {
        fail(e.code());
    }
    reap();
}

int CopyContext::copy_pipeline() {
    while (!all_tasks_done() && error_ == 0 && !g_interrupted) {
        // Fill pipeline with new reads for free slots
        for (size_t i = 0; i < slots_.size(); i++) {
            if (slots_[i].state == SlotState::Free && error_ == 0 && !g_interrupted) {
                fill_slot(i);
            }
        }
        if (in_flight() == 0) {
            if (all_tasks_done()) break;
            // Nothing could be started; a failure has been recorded
            if (error_ != 0) break;
            continue;
        }
        wait();
        progress_update(config_, queue_, false);
    }

    // Drain remaining ops if exiting due to error/interrupt
    while (in_flight() > 0) {
        wait();
    }
    return error_;
}

// ============================================================================
// Cleanup helpers
// ============================================================================

static void cleanup_partial_files(const TaskQueue &queue, bool keep) {
    if (keep) return;
    for (const auto &t : queue.tasks) {
        if (!t.done && !t.dst_path.empty()) {
            unlink(t.dst_path.c_str());
        }
    }
}

static void close_remaining_fds(TaskQueue &queue) {
    for (auto &t : queue.tasks) {
        if (t.src_fd >= 0) {
            close(t.src_fd);
            t.src_fd = -1;
        }
        if (t.dst_fd >= 0) {
            close(t.dst_fd);
            t.dst_fd = -1;
        }
    }
}

// ============================================================================
// CLI parsing
// ============================================================================

static void print_usage(const char *argv0) {
    fprintf(stderr,
            "Usage: %s [OPTIONS] SOURCE... DEST\n"
            "\n"
            "Async pipelined file copy over POSIX AIO.\n"
            "\n"
            "Options:\n"
            "  -r, --recursive      Copy directories recursively\n"
            "  -b, --block-size N   I/O block size (default: 256K). Suffixes: K, M, G\n"
            "  -p, --pipeline N     In-flight buffer slots (default: %d, max: %d)\n"
            "  -t, --threads N      AIO worker threads (default: 2x pipeline)\n"
            "  -q, --quiet          Suppress all output\n"
            "  --no-fsync           Skip per-file fsync\n"
            "  --no-progress        Disable progress bar\n"
            "  --preserve           Preserve timestamps (mtime, atime)\n"
            "  --keep-partial       Don't delete partial files on error\n"
            "  -v, --verbose        Show copy statistics and library diagnostics\n"
            "  -h, --help           Show this help\n",
            argv0, DEFAULT_PIPELINE, MAX_PIPELINE);
}

static int parse_args(int argc, char **argv, Config &config) {
    static struct option long_opts[] = {{"recursive", no_argument, nullptr, 'r'},
                                        {"block-size", required_argument, nullptr, 'b'},
                                        {"pipeline", required_argument, nullptr, 'p'},
                                        {"threads", required_argument, nullptr, 't'},
                                        {"quiet", no_argument, nullptr, 'q'},
                                        {"no-fsync", no_argument, nullptr, 'F'},
                                        {"no-progress", no_argument, nullptr, 'P'},
                                        {"preserve", no_argument, nullptr, 'T'},
                                        {"keep-partial", no_argument, nullptr, 'K'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, "rb:p:t:qvh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'r':
            config.recursive = true;
            break;
        case 'b': {
            ssize_t sz = parse_size(optarg);
            if (sz <= 0) {
                fprintf(stderr, "saiocp: invalid block size: %s\n", optarg);
                return -1;
            }
            config.chunk_size = static_cast<size_t>(sz);
            break;
        }
        case 'p': {
            int val = atoi(optarg);
            if (val < 1 || val > MAX_PIPELINE) {
                fprintf(stderr, "saiocp: pipeline depth must be 1-%d\n", MAX_PIPELINE);
                return -1;
            }
            config.pipeline_depth = val;
            break;
        }
        case 't': {
            int val = atoi(optarg);
            if (val < 1) {
                fprintf(stderr, "saiocp: invalid thread count: %s\n", optarg);
                return -1;
            }
            config.aio_threads = val;
            break;
        }
        case 'q':
            config.quiet = true;
            break;
        case 'F':
            config.no_fsync = true;
            break;
        case 'P':
            config.no_progress = true;
            break;
        case 'T':
            config.preserve = true;
            break;
        case 'K':
            config.keep_partial = true;
            break;
        case 'v':
            config.verbose = true;
            break;
        case 'h':
            print_usage(argv[0]);
            exit(0);
        default:
            print_usage(argv[0]);
            return -1;
        }
    }

    int remaining = argc - optind;
    if (remaining < 2) {
        fprintf(stderr, "saiocp: expected SOURCE... DEST arguments\n");
        print_usage(argv[0]);
        return -1;
    }

    for (int i = optind; i < argc - 1; i++) config.sources.push_back(argv[i]);
    config.dest = argv[argc - 1];
    return 0;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char **argv) {
    Config config;
    if (parse_args(argc, argv, config) != 0) return 1;

    struct sigaction sa = {};
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);

    if (config.verbose) {
        saio::set_log_handler([](saio::LogLevel level, std::string_view msg) {
            fprintf(stderr, "saiocp: [%s] %.*s\n", saio::log_level_name(level),
                    static_cast<int>(msg.size()), msg.data());
        });
    }

    TaskQueue queue;
    if (build_task_list(config, queue) != 0) return 1;

    if (!config.quiet) {
        char total_str[32];
        format_bytes(total_str, sizeof(total_str), static_cast<double>(queue.total_bytes));
        fprintf(stderr, "saiocp: %d file%s (%s)\n", queue.total_files(),
                queue.total_files() == 1 ? "" : "s", total_str);
    }

    try {
        int threads = config.aio_threads > 0 ? config.aio_threads : config.pipeline_depth * 2;
        saio::configure(saio::Options().threads(threads).num(config.pipeline_depth * 2));

        CopyContext ctx(config, queue);

        clock_gettime(CLOCK_MONOTONIC, &g_start_time);
        int err = ctx.copy_pipeline();

        progress_update(config, queue, true);

        if (config.verbose && err == 0 && !g_interrupted) {
            double elapsed = elapsed_since_start();

            char size_str[32], rate_str[32], chunk_str[32], pipe_str[32];
            format_bytes(size_str, sizeof(size_str), static_cast<double>(queue.total_written));
            format_rate(rate_str, sizeof(rate_str),
                        elapsed > 0 ? static_cast<double>(queue.total_written) / elapsed : 0);
            format_bytes(chunk_str, sizeof(chunk_str), static_cast<double>(config.chunk_size));
            format_bytes(pipe_str, sizeof(pipe_str),
                         static_cast<double>(config.chunk_size) * config.pipeline_depth);

            fprintf(stderr, "Copied %d file%s (%s) in %.2fs\n", queue.completed_files,
                    queue.completed_files == 1 ? "" : "s", size_str, elapsed);
            fprintf(stderr, "Throughput: %s\n", rate_str);
            fprintf(stderr, "Pipeline: %d buffers x %s = %s\n", config.pipeline_depth, chunk_str,
                    pipe_str);
        }

        close_remaining_fds(queue);

        if (err != 0 || g_interrupted) {
            cleanup_partial_files(queue, config.keep_partial);
            if (g_interrupted) {
                fprintf(stderr, "\nsaiocp: interrupted\n");
                return 130;
            }
            return 1;
        }

        return 0;

    } catch (const saio::Error &e) {
        fprintf(stderr, "saiocp: error: %s\n", e.what());
        close_remaining_fds(queue);
        return 1;
    } catch (const std::exception &e) {
        fprintf(stderr, "saiocp: error: %s\n", e.what());
        close_remaining_fds(queue);
        return 1;
    }
}
