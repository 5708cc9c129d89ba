#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstring>
#include <limits>
#include <new>
#include <span>
#include <type_traits>
#include <utility>

namespace xmute
{
namespace detail
{
struct buffer_access;
}

// Owning, over-aligned storage for trivially copyable elements. The
// allocation outlives changes of element type: converting a buffer of bytes
// into a buffer of T hands over the same memory instead of copying it.
template <typename T>
class buffer
{
public:
    static_assert(std::is_trivially_copyable_v<T>, "buffer only holds trivially copyable elements");

    static constexpr std::size_t cDefaultAlignment = std::max(alignof(T), alignof(std::max_align_t));

    buffer() = default;

    // Zero filled. alignment is rounded up to a power of two no smaller than alignof(T).
    explicit buffer(std::size_t size, std::size_t alignment = cDefaultAlignment)
        : size_(size), capacity_bytes_(byte_count(size)), alignment_(round_alignment(alignment))
    {
        storage_ = allocate(capacity_bytes_, alignment_);
        if (storage_)
        {
            std::memset(storage_, 0, capacity_bytes_);
        }
    }

    explicit buffer(std::span<const T> values, std::size_t alignment = cDefaultAlignment)
        : size_(values.size()), capacity_bytes_(values.size_bytes()), alignment_(round_alignment(alignment))
    {
        storage_ = allocate(capacity_bytes_, alignment_);
        if (storage_)
        {
            std::memcpy(storage_, values.data(), capacity_bytes_);
        }
    }

    buffer(const buffer&) = delete;
    buffer& operator=(const buffer&) = delete;

    buffer(buffer&& other) noexcept
        : storage_(std::exchange(other.storage_, nullptr)), size_(std::exchange(other.size_, 0)),
          capacity_bytes_(std::exchange(other.capacity_bytes_, 0)), alignment_(other.alignment_)
    {
    }

    buffer& operator=(buffer&& other) noexcept
    {
        if (this != &other)
        {
            release();
            storage_ = std::exchange(other.storage_, nullptr);
            size_ = std::exchange(other.size_, 0);
            capacity_bytes_ = std::exchange(other.capacity_bytes_, 0);
            alignment_ = other.alignment_;
        }
        return *this;
    }

    ~buffer() { release(); }

    T* data() { return reinterpret_cast<T*>(storage_); }
    const T* data() const { return reinterpret_cast<const T*>(storage_); }

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    std::size_t size_bytes() const { return size_ * sizeof(T); }
    // Whole elements the allocation could hold
    std::size_t capacity() const { return capacity_bytes_ / sizeof(T); }
    std::size_t alignment() const { return alignment_; }

    T* begin() { return data(); }
    T* end() { return data() + size_; }
    const T* begin() const { return data(); }
    const T* end() const { return data() + size_; }

    T& operator[](std::size_t n) { return data()[n]; }
    const T& operator[](std::size_t n) const { return data()[n]; }

    std::span<T> view() { return {data(), size_}; }
    std::span<const T> view() const { return {data(), size_}; }

    std::span<const std::byte> bytes() const { return {storage_, size_bytes()}; }
    std::span<std::byte> writable_bytes() { return {storage_, size_bytes()}; }

private:
    friend struct detail::buffer_access;

    static std::size_t round_alignment(std::size_t alignment)
    {
        return std::bit_ceil(std::max(alignment, alignof(T)));
    }

    static std::size_t byte_count(std::size_t size)
    {
        if (size > std::numeric_limits<std::size_t>::max() / sizeof(T))
        {
            throw std::bad_array_new_length{};
        }
        return size * sizeof(T);
    }

    static std::byte* allocate(std::size_t bytes, std::size_t alignment)
    {
        if (bytes == 0)
        {
            return nullptr;
        }
        return static_cast<std::byte*>(::operator new(bytes, std::align_val_t{alignment}));
    }

    void release()
    {
        if (storage_)
        {
            ::operator delete(storage_, std::align_val_t{alignment_});
            storage_ = nullptr;
        }
        size_ = 0;
        capacity_bytes_ = 0;
    }

    std::byte* storage_{nullptr};
    std::size_t size_ = 0;
    std::size_t capacity_bytes_ = 0;
    std::size_t alignment_ = cDefaultAlignment;
};

namespace detail
{
struct buffer_access
{
    // Moves the allocation of from into a buffer of count Us. The caller has
    // checked that the memory is aligned for U and holds count valid Us.
    template <typename U, typename T>
    static buffer<U> rebind(buffer<T>&& from, std::size_t count)
    {
        buffer<U> result;
        result.storage_ = std::exchange(from.storage_, nullptr);
        result.size_ = count;
        result.capacity_bytes_ = std::exchange(from.capacity_bytes_, 0);
        result.alignment_ = from.alignment_;
        from.size_ = 0;
        return result;
    }
};
}
}
