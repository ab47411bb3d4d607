/**
 * @file notification.hpp
 * @brief Completion notification descriptor for saio
 *
 * Thin value wrapper around struct sigevent.  The library never acts on
 * it; it is stored in a request (or passed to list submission) and handed
 * to the native AIO calls unmodified.
 */

#ifndef SAIO_NOTIFICATION_HPP
#define SAIO_NOTIFICATION_HPP

#include <csignal>
#include <cstdint>
#include <pthread.h>

namespace saio {

/**
 * How completion is delivered
 */
enum class NotifyKind {
    None,   ///< No notification; poll with Request::poll_error() or suspend()
    Signal, ///< Queue a signal to the process
    Thread  ///< Invoke a callback on a new thread
};

/**
 * Completion notification descriptor
 *
 * Example:
 * @code
 * auto opts = saio::RequestOptions().notification(
 *     saio::Notification::signal(SIGUSR2, 42));
 * @endcode
 */
class Notification {
  public:
    /// Callback type for thread notification
    using Callback = void (*)(union sigval);

    /**
     * Default constructor - no notification
     */
    Notification() noexcept;

    [[nodiscard]] static Notification none() noexcept { return Notification(); }

    /**
     * Deliver @p signo on completion
     * @param signo Signal number
     * @param value Value placed in si_value
     * @return Signal notification
     */
    [[nodiscard]] static Notification signal(int signo, std::intptr_t value = 0) noexcept;

    /**
     * Run @p fn on a new thread on completion
     * @param fn Callback
     * @param value Value passed to the callback
     * @param attributes Thread attributes (may be null, must outlive the request)
     * @return Thread notification
     */
    [[nodiscard]] static Notification thread(Callback fn, std::intptr_t value = 0,
                                             pthread_attr_t *attributes = nullptr) noexcept;

    /**
     * Reconstruct from a native sigevent
     * @param sev Native descriptor
     * @return Equivalent Notification
     * @throws Error (EINVAL) for notify kinds this wrapper does not model
     */
    [[nodiscard]] static Notification from_native(const struct sigevent &sev);

    [[nodiscard]] NotifyKind kind() const noexcept;

    /// Signal number (Signal kind only, 0 otherwise)
    [[nodiscard]] int signo() const noexcept;

    /// User value carried in the sigval
    [[nodiscard]] std::intptr_t value() const noexcept;

    /// Callback (Thread kind only, nullptr otherwise)
    [[nodiscard]] Callback callback() const noexcept;

    /// Thread attributes (Thread kind only, nullptr otherwise)
    [[nodiscard]] pthread_attr_t *attributes() const noexcept;

    /**
     * Get underlying native descriptor
     * @return Reference to struct sigevent
     */
    [[nodiscard]] const struct sigevent &native() const noexcept { return sev_; }

    [[nodiscard]] bool operator==(const Notification &other) const noexcept;

  private:
    struct sigevent sev_;
};

} // namespace saio

#endif // SAIO_NOTIFICATION_HPP
