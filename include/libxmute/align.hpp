#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>

namespace xmute
{
struct alignment_check
{
    std::size_t alignment;
    // Smallest n such that address + n is aligned, always below alignment
    std::size_t offset_to_next_valid;

    bool is_aligned() const { return offset_to_next_valid == 0; }
};

// alignment is expected to be a power of two; 0 and 1 are always aligned.
alignment_check check_alignment(std::uintptr_t address, std::size_t alignment);

// Bytes left once the misaligned prefix is skipped, 0 if it eats the buffer
std::size_t usable_bytes(std::size_t length, const alignment_check& check);

template <typename T>
alignment_check check_alignment(const void* data)
{
    return check_alignment(reinterpret_cast<std::uintptr_t>(data), alignof(T));
}

template <typename T>
alignment_check check_alignment(std::span<const std::byte> bytes)
{
    return check_alignment<T>(static_cast<const void*>(bytes.data()));
}

// Drops the leading bytes that keep bytes from being aligned for T
template <typename T>
std::span<const std::byte> realign(std::span<const std::byte> bytes)
{
    auto check = check_alignment<T>(bytes);
    return bytes.subspan(std::min(check.offset_to_next_valid, bytes.size()));
}
}
