/**
 * @file options.cpp
 * @brief Library-wide configuration
 */

#include <saio/options.hpp>
#include <saio/error.hpp>

#include "log.hpp"

#include <aio.h>

#include <cstring>

namespace saio {

void configure(const Options &opts) {
    if (opts.threads() < 1 || opts.num() < 1 || opts.idle_time() < 0) {
        throw Error(EINVAL, "configure");
    }

#if defined(__GLIBC__)
    struct aioinit init;
    std::memset(&init, 0, sizeof(init));
    init.aio_threads = opts.threads();
    init.aio_num = opts.num();
    init.aio_idle_time = opts.idle_time();
    aio_init(&init);
    detail::log(LogLevel::Info, "aio_init: threads=%d num=%d idle_time=%ds", opts.threads(),
                opts.num(), opts.idle_time());
#else
    detail::log(LogLevel::Notice, "configure: the C library exposes no AIO tunables");
#endif
}

} // namespace saio
