/**
 * @file contract.cpp
 * @brief Fatal contract-violation reporting
 */

#include "contract.hpp"
#include "log.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace saio::detail {

void contract_violation(const char *fmt, ...) noexcept {
    char msg[512];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    log(LogLevel::Error, "contract violation: %s", msg);
    std::abort();
}

} // namespace saio::detail
