/**
 * @file contract.hpp
 * @brief Fatal contract-violation reporting
 *
 * A contract violation means the kernel may still hold a pointer into memory
 * the caller is about to reuse.  There is no safe way to continue, so these
 * checks log through the handler and abort the process.
 */

#ifndef SAIO_SRC_CONTRACT_HPP
#define SAIO_SRC_CONTRACT_HPP

namespace saio::detail {

[[noreturn]] void contract_violation(const char *fmt, ...) noexcept
    __attribute__((format(printf, 1, 2)));

} // namespace saio::detail

#endif // SAIO_SRC_CONTRACT_HPP
