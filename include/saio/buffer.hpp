/**
 * @file buffer.hpp
 * @brief Byte buffers and the buffer ownership variant for saio
 *
 * Once a request is submitted the kernel keeps a raw pointer into its
 * buffer until the operation completes.  The types here make the owner of
 * that memory explicit:
 *
 * - Bytes:       exclusive, mutable, move-only
 * - SharedBytes: reference counted, immutable
 * - Lease:       caller-owned memory lent to requests, with a runtime guard
 * - Buffer:      the variant a Request holds (none / shared / exclusive / borrowed)
 *
 * Bytes and SharedBytes keep small payloads inline in the object itself.
 * Inline data moves with the object, so a Request always forces such
 * buffers out of line before capturing their address.
 */

#ifndef SAIO_BUFFER_HPP
#define SAIO_BUFFER_HPP

#include <saio/fwd.hpp>

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <variant>

namespace saio {

/**
 * Uniquely owned, mutable byte buffer
 *
 * Move-only (cannot be copied).  Payloads up to inline_capacity bytes are
 * stored inside the object; anything larger lives in a heap block whose
 * address survives moves.
 */
class Bytes {
  public:
    /// Largest payload stored inline (23 bytes on LP64)
    static constexpr size_t inline_capacity = 3 * sizeof(void *) - 1;

    /**
     * Default constructor - creates empty inline buffer
     */
    Bytes() noexcept = default;

    /**
     * Copy the given bytes into a new buffer
     * @param src Source bytes
     */
    explicit Bytes(std::span<const std::byte> src);

    /**
     * Copy the given characters into a new buffer
     * @param src Source characters
     */
    explicit Bytes(std::string_view src);

    /**
     * Create an empty buffer able to hold @p capacity bytes
     *
     * A capacity above inline_capacity always allocates out of line.
     *
     * @param capacity Requested capacity in bytes
     * @return Empty buffer
     */
    [[nodiscard]] static Bytes with_capacity(size_t capacity);

    /**
     * Create a zero-filled buffer of @p size bytes
     * @param size Buffer size in bytes
     * @return Zero-filled buffer
     */
    [[nodiscard]] static Bytes zeroed(size_t size);

    Bytes(Bytes &&other) noexcept;
    Bytes &operator=(Bytes &&other) noexcept;

    // Non-copyable
    Bytes(const Bytes &) = delete;
    Bytes &operator=(const Bytes &) = delete;

    ~Bytes() = default;

    [[nodiscard]] std::byte *data() noexcept { return heap_ ? heap_.get() : inline_.data(); }
    [[nodiscard]] const std::byte *data() const noexcept {
        return heap_ ? heap_.get() : inline_.data();
    }
    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] size_t capacity() const noexcept { return heap_ ? capacity_ : inline_capacity; }

    /**
     * Check whether the payload is stored inside this object
     *
     * Inline data changes address whenever the Bytes object moves.
     *
     * @return True if stored inline
     */
    [[nodiscard]] bool is_inline() const noexcept { return !heap_; }

    [[nodiscard]] std::span<std::byte> span() noexcept { return {data(), size_}; }
    [[nodiscard]] std::span<const std::byte> span() const noexcept { return {data(), size_}; }

    /**
     * View the contents as characters
     * @return string_view over the buffer
     */
    [[nodiscard]] std::string_view str() const noexcept {
        return {reinterpret_cast<const char *>(data()), size_};
    }

    /**
     * Ensure capacity for at least @p capacity bytes
     *
     * May move the payload out of line; never moves it back inline.
     *
     * @param capacity Minimum capacity
     */
    void reserve(size_t capacity);

    /**
     * Resize the buffer, zero-filling any new bytes
     * @param size New size in bytes
     */
    void resize(size_t size);

    /**
     * Append bytes to the end of the buffer
     * @param src Bytes to append
     */
    void extend(std::span<const std::byte> src);

    /**
     * Append characters to the end of the buffer
     * @param src Characters to append
     */
    void extend(std::string_view src);

    /**
     * Set size to zero, keeping the current storage
     */
    void clear() noexcept { size_ = 0; }

    /**
     * Convert into an immutable shared buffer
     *
     * Heap storage is handed over without copying.
     *
     * @return SharedBytes with the same contents
     */
    [[nodiscard]] SharedBytes freeze() &&;

  private:
    friend class SharedBytes;

    std::unique_ptr<std::byte[]> heap_;
    size_t size_ = 0;
    size_t capacity_ = 0;
    std::array<std::byte, inline_capacity> inline_{};
};

/**
 * Reference-counted, immutable byte buffer
 *
 * Copies of a heap-backed SharedBytes share one block.  Small payloads are
 * stored inline and copied by value, so their address is not stable.
 */
class SharedBytes {
  public:
    static constexpr size_t inline_capacity = Bytes::inline_capacity;

    /**
     * Default constructor - creates empty inline buffer
     */
    SharedBytes() noexcept = default;

    /**
     * Copy the given bytes into a new shared buffer
     * @param src Source bytes
     */
    explicit SharedBytes(std::span<const std::byte> src);

    /**
     * Copy the given characters into a new shared buffer
     * @param src Source characters
     */
    explicit SharedBytes(std::string_view src);

    /**
     * Take over an exclusive buffer (no copy if it is heap-backed)
     * @param bytes Buffer to freeze
     */
    explicit SharedBytes(Bytes &&bytes);

    /**
     * Copy bytes into a heap block regardless of size
     * @param src Source bytes
     * @return Heap-backed SharedBytes
     */
    [[nodiscard]] static SharedBytes copy_out_of_line(std::span<const std::byte> src);

    [[nodiscard]] const std::byte *data() const noexcept {
        return heap_ ? heap_.get() : inline_.data();
    }
    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] bool is_inline() const noexcept { return !heap_; }
    [[nodiscard]] std::span<const std::byte> span() const noexcept { return {data(), size_}; }
    [[nodiscard]] std::string_view str() const noexcept {
        return {reinterpret_cast<const char *>(data()), size_};
    }

    /**
     * Number of SharedBytes sharing the heap block
     * @return Owner count, or 0 for inline storage
     */
    [[nodiscard]] long use_count() const noexcept { return heap_.use_count(); }

  private:
    std::shared_ptr<const std::byte[]> heap_;
    size_t size_ = 0;
    std::array<std::byte, inline_capacity> inline_{};
};

namespace detail {

/// Shared between a Lease and every Request borrowing from it
struct LeaseState {
    std::atomic<int> in_flight{0};
    std::atomic<bool> released{false};
};

} // namespace detail

/**
 * Caller-owned memory lent to one or more Requests
 *
 * The lease itself does not own the memory; the caller must keep the
 * referenced bytes alive and at a fixed address for as long as the lease
 * exists.  The lease tracks how many bound requests are in flight, and
 * destroying it while any of them is still running aborts the process
 * instead of letting the kernel write into freed memory.
 *
 * Non-copyable and non-movable.
 *
 * Example:
 * @code
 * std::array<std::byte, 4096> storage;
 * saio::Lease lease{std::span<std::byte>(storage)};
 * auto req = saio::Request::from_slice(fd, 0, lease);
 * @endcode
 */
class Lease {
  public:
    /**
     * Lend mutable memory (usable for reads and writes)
     * @param data Memory to lend
     */
    explicit Lease(std::span<std::byte> data);

    /**
     * Lend immutable memory (writes only)
     * @param data Memory to lend
     */
    explicit Lease(std::span<const std::byte> data);

    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;
    Lease(Lease &&) = delete;
    Lease &operator=(Lease &&) = delete;

    /**
     * Destructor - fatal if a borrowing request is still in flight
     */
    ~Lease();

    [[nodiscard]] const std::byte *data() const noexcept { return data_; }
    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] bool is_mutable() const noexcept { return mutable_; }

    /**
     * Check whether any borrowing request is in flight
     * @return True if the memory must not be touched
     */
    [[nodiscard]] bool in_use() const noexcept {
        return state_->in_flight.load(std::memory_order_acquire) > 0;
    }

  private:
    friend class Request;

    std::byte *data_;
    size_t size_;
    bool mutable_;
    std::shared_ptr<detail::LeaseState> state_;
};

/**
 * Borrowed alternative of the buffer ownership variant
 *
 * Records the lent span and keeps the lease's guard state alive.
 */
class Borrowed {
  public:
    [[nodiscard]] const std::byte *data() const noexcept { return data_; }
    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] bool is_mutable() const noexcept { return mutable_; }
    [[nodiscard]] std::span<const std::byte> span() const noexcept { return {data_, size_}; }

    /**
     * Check whether the originating Lease has been destroyed
     * @return True if the memory may no longer be valid
     */
    [[nodiscard]] bool expired() const noexcept {
        return state_->released.load(std::memory_order_acquire);
    }

  private:
    friend class Request;

    Borrowed(std::byte *data, size_t size, bool is_mutable,
             std::shared_ptr<detail::LeaseState> state) noexcept
        : data_(data), size_(size), mutable_(is_mutable), state_(std::move(state)) {}

    void pin() const noexcept { state_->in_flight.fetch_add(1, std::memory_order_acq_rel); }
    void unpin() const noexcept { state_->in_flight.fetch_sub(1, std::memory_order_acq_rel); }

    std::byte *data_;
    size_t size_;
    bool mutable_;
    std::shared_ptr<detail::LeaseState> state_;
};

/**
 * How (or whether) a request owns the memory the kernel touches
 */
enum class BufferKind {
    None,      ///< No memory (fsync, raw pointers)
    Shared,    ///< SharedBytes, writes only
    Exclusive, ///< Bytes, reads and writes
    Borrowed   ///< Memory lent through a Lease
};

/**
 * Buffer ownership variant held by a Request
 *
 * Move-only.  Returned by Request::extract_buffer() once the request is
 * no longer in flight.
 */
class Buffer {
  public:
    /**
     * Default constructor - holds no memory
     */
    Buffer() noexcept = default;
    Buffer(SharedBytes bytes) noexcept : v_(std::move(bytes)) {}
    Buffer(Bytes &&bytes) noexcept : v_(std::move(bytes)) {}
    Buffer(Borrowed borrowed) noexcept : v_(std::move(borrowed)) {}

    Buffer(Buffer &&) noexcept = default;
    Buffer &operator=(Buffer &&) noexcept = default;
    Buffer(const Buffer &) = delete;
    Buffer &operator=(const Buffer &) = delete;

    [[nodiscard]] BufferKind kind() const noexcept { return static_cast<BufferKind>(v_.index()); }
    [[nodiscard]] bool is_none() const noexcept { return kind() == BufferKind::None; }

    /**
     * Get the inner SharedBytes, if any
     * @return Pointer to SharedBytes or nullptr
     */
    [[nodiscard]] const SharedBytes *shared() const noexcept { return std::get_if<SharedBytes>(&v_); }

    /**
     * Get the inner Bytes, if any
     * @return Pointer to Bytes or nullptr
     */
    [[nodiscard]] Bytes *exclusive() noexcept { return std::get_if<Bytes>(&v_); }
    [[nodiscard]] const Bytes *exclusive() const noexcept { return std::get_if<Bytes>(&v_); }

    /**
     * Get the borrowed span record, if any
     * @return Pointer to Borrowed or nullptr
     */
    [[nodiscard]] const Borrowed *borrowed() const noexcept { return std::get_if<Borrowed>(&v_); }

  private:
    friend class Request;

    std::variant<std::monostate, SharedBytes, Bytes, Borrowed> v_;
};

} // namespace saio

#endif // SAIO_BUFFER_HPP
