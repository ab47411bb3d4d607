/**
 * @file options.hpp
 * @brief Library-wide configuration for saio
 */

#ifndef SAIO_OPTIONS_HPP
#define SAIO_OPTIONS_HPP

namespace saio {

/**
 * Tuning for the C library's AIO worker pool
 *
 * Uses builder pattern for fluent configuration.  Only glibc exposes these
 * knobs (through aio_init); elsewhere configure() accepts and ignores them.
 * Defaults match glibc's own.
 *
 * Example:
 * @code
 * saio::configure(saio::Options().threads(8).num(128).idle_time(5));
 * @endcode
 */
class Options {
  public:
    /**
     * Initialize with default options
     */
    Options() noexcept = default;

    /**
     * Set maximum number of worker threads
     * @param count Thread count (default: 20, must be >= 1)
     * @return Reference to this for chaining
     */
    Options &threads(int count) noexcept {
        threads_ = count;
        return *this;
    }

    /**
     * Set expected number of simultaneous requests
     * @param count Request count (default: 64, must be >= 1)
     * @return Reference to this for chaining
     */
    Options &num(int count) noexcept {
        num_ = count;
        return *this;
    }

    /**
     * Set how long an idle worker lingers before exiting
     * @param seconds Idle time in seconds (default: 1)
     * @return Reference to this for chaining
     */
    Options &idle_time(int seconds) noexcept {
        idle_time_ = seconds;
        return *this;
    }

    // Getters
    [[nodiscard]] int threads() const noexcept { return threads_; }
    [[nodiscard]] int num() const noexcept { return num_; }
    [[nodiscard]] int idle_time() const noexcept { return idle_time_; }

  private:
    int threads_ = 20;
    int num_ = 64;
    int idle_time_ = 1;
};

/**
 * Apply worker-pool tuning
 *
 * Call before the first submission; later calls may be ignored by the C
 * library.
 *
 * @param opts Options to apply
 * @throws Error (EINVAL) if a value is out of range
 */
void configure(const Options &opts);

} // namespace saio

#endif // SAIO_OPTIONS_HPP
