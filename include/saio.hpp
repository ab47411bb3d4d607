/**
 * @file saio.hpp
 * @brief Main header for saio
 *
 * This is the single header you need to include to use saio.  It wraps
 * POSIX asynchronous I/O (<aio.h>) so that the memory the kernel writes
 * into cannot be freed, moved or reused while an operation is in flight.
 *
 * Example:
 * @code
 * #include <saio.hpp>
 *
 * int main() {
 *     int fd = open("file.txt", O_RDONLY);
 *     auto req = saio::Request::from_owned(fd, 0, saio::Bytes::zeroed(4096));
 *     req.submit_read();
 *
 *     const saio::Request *list[] = {&req};
 *     while (req.in_progress()) {
 *         (void)saio::suspend(list);
 *     }
 *     ssize_t n = req.collect_result();
 *     saio::Buffer buf = req.extract_buffer();
 *     std::cout << "Read " << n << " bytes\n";
 *     close(fd);
 * }
 * @endcode
 */

#ifndef SAIO_HPP
#define SAIO_HPP

// Order matters for dependencies
#include <saio/fwd.hpp>
#include <saio/error.hpp>
#include <saio/log.hpp>
#include <saio/options.hpp>
#include <saio/buffer.hpp>
#include <saio/notification.hpp>
#include <saio/request.hpp>
#include <saio/batch.hpp>

#endif // SAIO_HPP
