/**
 * @file error.hpp
 * @brief Error exception class for saio
 */

#ifndef SAIO_ERROR_HPP
#define SAIO_ERROR_HPP

#include <cerrno>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>

namespace saio {

/**
 * Exception class for recoverable AIO errors
 *
 * Wraps errno values with optional context message. Thrown when a native
 * call refuses a request (submission-time errors) and when a completed
 * operation's result is collected and the operation had failed.
 *
 * Contract violations are never reported through this class.
 */
class Error : public std::exception {
public:
    /**
     * Construct error from errno value
     *
     * @param err Error code (positive errno value)
     * @param context Optional context message
     */
    explicit Error(int err, std::string_view context = {})
        : code_(err)
    {
        // std::generic_category().message() is thread-safe, strerror() may not be
        std::string errmsg = std::generic_category().message(err);
        if (context.empty()) {
            message_ = std::move(errmsg);
        } else {
            message_ = std::string(context) + ": " + errmsg;
        }
    }

    /**
     * Get the error code
     * @return Positive errno value
     */
    [[nodiscard]] int code() const noexcept { return code_; }

    /**
     * Get the error code as a std::error_code
     * @return error_code in the generic category
     */
    [[nodiscard]] std::error_code error_code() const noexcept {
        return {code_, std::generic_category()};
    }

    /**
     * Get human-readable error message
     * @return Error message string
     */
    [[nodiscard]] const char* what() const noexcept override {
        return message_.c_str();
    }

    // Convenience predicates
    [[nodiscard]] bool is_invalid() const noexcept { return code_ == EINVAL; }
    [[nodiscard]] bool is_again() const noexcept { return code_ == EAGAIN; }
    [[nodiscard]] bool is_bad_descriptor() const noexcept { return code_ == EBADF; }
    [[nodiscard]] bool is_cancelled() const noexcept { return code_ == ECANCELED; }
    [[nodiscard]] bool is_interrupted() const noexcept { return code_ == EINTR; }
    [[nodiscard]] bool is_in_progress() const noexcept { return code_ == EINPROGRESS; }
    [[nodiscard]] bool is_not_supported() const noexcept {
        return code_ == ENOSYS || code_ == EOPNOTSUPP;
    }

private:
    int code_;
    std::string message_;
};

/**
 * Throw Error if condition is false
 *
 * @param condition Condition to check
 * @param context Error context message
 * @throws Error with current errno if condition is false
 */
inline void check(bool condition, std::string_view context = {}) {
    if (!condition) {
        throw Error(errno, context);
    }
}

/**
 * Throw Error from current errno
 *
 * @param context Error context message
 * @throws Error with current errno
 */
[[noreturn]] inline void throw_errno(std::string_view context = {}) {
    throw Error(errno, context);
}

} // namespace saio

#endif // SAIO_ERROR_HPP
