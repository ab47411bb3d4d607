/**
 * @file notification.cpp
 * @brief Completion notification descriptor
 */

#include <saio/notification.hpp>
#include <saio/error.hpp>

#include <cstring>

namespace saio {

Notification::Notification() noexcept {
    // Reserved fields are OS-specific and must be zero
    std::memset(&sev_, 0, sizeof(sev_));
    sev_.sigev_notify = SIGEV_NONE;
}

Notification Notification::signal(int signo, std::intptr_t value) noexcept {
    Notification n;
    n.sev_.sigev_notify = SIGEV_SIGNAL;
    n.sev_.sigev_signo = signo;
    n.sev_.sigev_value.sival_ptr = reinterpret_cast<void *>(value);
    return n;
}

Notification Notification::thread(Callback fn, std::intptr_t value,
                                  pthread_attr_t *attributes) noexcept {
    Notification n;
    n.sev_.sigev_notify = SIGEV_THREAD;
    n.sev_.sigev_notify_function = fn;
    n.sev_.sigev_notify_attributes = attributes;
    n.sev_.sigev_value.sival_ptr = reinterpret_cast<void *>(value);
    return n;
}

Notification Notification::from_native(const struct sigevent &sev) {
    auto value = reinterpret_cast<std::intptr_t>(sev.sigev_value.sival_ptr);
    switch (sev.sigev_notify) {
    case SIGEV_NONE:
        return none();
    case SIGEV_SIGNAL:
        return signal(sev.sigev_signo, value);
    case SIGEV_THREAD:
        return thread(sev.sigev_notify_function, value, sev.sigev_notify_attributes);
    default:
        throw Error(EINVAL, "Notification::from_native: unsupported sigev_notify");
    }
}

NotifyKind Notification::kind() const noexcept {
    switch (sev_.sigev_notify) {
    case SIGEV_SIGNAL:
        return NotifyKind::Signal;
    case SIGEV_THREAD:
        return NotifyKind::Thread;
    default:
        return NotifyKind::None;
    }
}

int Notification::signo() const noexcept {
    return kind() == NotifyKind::Signal ? sev_.sigev_signo : 0;
}

std::intptr_t Notification::value() const noexcept {
    return kind() == NotifyKind::None ? 0
                                      : reinterpret_cast<std::intptr_t>(sev_.sigev_value.sival_ptr);
}

Notification::Callback Notification::callback() const noexcept {
    return kind() == NotifyKind::Thread ? sev_.sigev_notify_function : nullptr;
}

pthread_attr_t *Notification::attributes() const noexcept {
    return kind() == NotifyKind::Thread ? sev_.sigev_notify_attributes : nullptr;
}

bool Notification::operator==(const Notification &other) const noexcept {
    return kind() == other.kind() && signo() == other.signo() && value() == other.value() &&
           callback() == other.callback() && attributes() == other.attributes();
}

} // namespace saio
