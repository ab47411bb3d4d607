/**
 * @file buffer.cpp
 * @brief Byte buffers and leases
 */

#include <saio/buffer.hpp>

#include "contract.hpp"

#include <algorithm>
#include <cstring>

namespace saio {

namespace {

std::span<const std::byte> as_bytes(std::string_view s) noexcept {
    return {reinterpret_cast<const std::byte *>(s.data()), s.size()};
}

} // namespace

// =============================================================================
// Bytes
// =============================================================================

Bytes::Bytes(std::span<const std::byte> src) {
    extend(src);
}

Bytes::Bytes(std::string_view src) : Bytes(as_bytes(src)) {}

Bytes Bytes::with_capacity(size_t capacity) {
    Bytes b;
    b.reserve(capacity);
    return b;
}

Bytes Bytes::zeroed(size_t size) {
    Bytes b;
    b.resize(size);
    return b;
}

Bytes::Bytes(Bytes &&other) noexcept
    : heap_(std::move(other.heap_)), size_(other.size_), capacity_(other.capacity_) {
    if (!heap_) {
        std::memcpy(inline_.data(), other.inline_.data(), size_);
    }
    other.size_ = 0;
    other.capacity_ = 0;
}

Bytes &Bytes::operator=(Bytes &&other) noexcept {
    if (this != &other) {
        heap_ = std::move(other.heap_);
        size_ = other.size_;
        capacity_ = other.capacity_;
        if (!heap_) {
            std::memcpy(inline_.data(), other.inline_.data(), size_);
        }
        other.size_ = 0;
        other.capacity_ = 0;
    }
    return *this;
}

void Bytes::reserve(size_t capacity) {
    if (capacity <= this->capacity()) {
        return;
    }
    size_t grown = std::max(capacity, heap_ ? capacity_ * 2 : capacity);
    auto block = std::make_unique<std::byte[]>(grown);
    if (size_) {
        std::memcpy(block.get(), data(), size_);
    }
    heap_ = std::move(block);
    capacity_ = grown;
}

void Bytes::resize(size_t size) {
    if (size > size_) {
        reserve(size);
        std::memset(data() + size_, 0, size - size_);
    }
    size_ = size;
}

void Bytes::extend(std::span<const std::byte> src) {
    if (src.empty()) {
        return;
    }
    reserve(size_ + src.size());
    std::memcpy(data() + size_, src.data(), src.size());
    size_ += src.size();
}

void Bytes::extend(std::string_view src) {
    extend(as_bytes(src));
}

SharedBytes Bytes::freeze() && {
    return SharedBytes(std::move(*this));
}

// =============================================================================
// SharedBytes
// =============================================================================

SharedBytes::SharedBytes(std::span<const std::byte> src) : size_(src.size()) {
    if (src.size() > inline_capacity) {
        *this = copy_out_of_line(src);
    } else if (!src.empty()) {
        std::memcpy(inline_.data(), src.data(), src.size());
    }
}

SharedBytes::SharedBytes(std::string_view src) : SharedBytes(as_bytes(src)) {}

SharedBytes::SharedBytes(Bytes &&bytes) : size_(bytes.size_) {
    if (bytes.heap_) {
        heap_ = std::shared_ptr<const std::byte[]>(std::move(bytes.heap_));
    } else if (size_) {
        std::memcpy(inline_.data(), bytes.inline_.data(), size_);
    }
    bytes.size_ = 0;
    bytes.capacity_ = 0;
}

SharedBytes SharedBytes::copy_out_of_line(std::span<const std::byte> src) {
    // Always allocate, even for zero bytes, so the result is never inline
    auto block = std::make_shared<std::byte[]>(std::max<size_t>(src.size(), 1));
    if (!src.empty()) {
        std::memcpy(block.get(), src.data(), src.size());
    }
    SharedBytes s;
    s.heap_ = std::move(block);
    s.size_ = src.size();
    return s;
}

// =============================================================================
// Lease
// =============================================================================

Lease::Lease(std::span<std::byte> data)
    : data_(data.data()), size_(data.size()), mutable_(true),
      state_(std::make_shared<detail::LeaseState>()) {}

Lease::Lease(std::span<const std::byte> data)
    : data_(const_cast<std::byte *>(data.data())), size_(data.size()), mutable_(false),
      state_(std::make_shared<detail::LeaseState>()) {}

Lease::~Lease() {
    int active = state_->in_flight.load(std::memory_order_acquire);
    if (active > 0) {
        detail::contract_violation("lease on %p (%zu bytes) released with %d request(s) in flight",
                                   static_cast<void *>(data_), size_, active);
    }
    state_->released.store(true, std::memory_order_release);
}

} // namespace saio
